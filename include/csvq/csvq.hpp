#pragma once

/// Convenience umbrella header for the csvq library.

#include <csvq/core/dataset.hpp>
#include <csvq/core/value.hpp>
#include <csvq/ir/spec.hpp>
#include <csvq/parser/expr.hpp>
#include <csvq/runtime/csv.hpp>
#include <csvq/runtime/ops.hpp>
#include <csvq/runtime/query.hpp>
