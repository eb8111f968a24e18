#pragma once

#include <csvq/core/dataset.hpp>
#include <csvq/ir/spec.hpp>

#include <cstdint>
#include <expected>
#include <iostream>
#include <string>

namespace csvq::ops {

enum class AggregationErrorKind : std::uint8_t {
    NonNumericColumn,
    EmptyInput,
};

struct AggregationError {
    AggregationErrorKind kind = AggregationErrorKind::EmptyInput;
    std::string column;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

// ─── Query stages ─────────────────────────────────────────────────────────────
//  Each stage reads its input and returns a new Dataset. The column named by
//  the spec must already be validated (see parser::validate_column); every
//  stage throws std::out_of_range for a column the dataset does not have.

/// Keep the rows whose cell compares to the operand as `spec.op` requires.
/// Row order is preserved.
[[nodiscard]] auto filter(const Dataset& input, const ir::FilterSpec& spec) -> Dataset;

/// Stable sort by the typed value of `spec.column`.
[[nodiscard]] auto order(const Dataset& input, const ir::SortSpec& spec) -> Dataset;

/// Reduce `spec.column` to a scalar. Every cell must be numeric.
[[nodiscard]] auto aggregate(const Dataset& input, const ir::AggregateSpec& spec)
    -> std::expected<double, AggregationError>;

// ─── Rendering ────────────────────────────────────────────────────────────────

/// Shortest round-trip rendering of a number (600, 4.9, 1e+21).
[[nodiscard]] auto format_number(double value) -> std::string;

/// Print an aligned table: header, separator, one line per row.
void print(const Dataset& data, std::ostream& out = std::cout);

}  // namespace csvq::ops
