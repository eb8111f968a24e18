#pragma once

#include <csvq/core/dataset.hpp>
#include <csvq/ir/spec.hpp>
#include <csvq/parser/expr.hpp>
#include <csvq/runtime/ops.hpp>

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace csvq::runtime {

/// The raw `--where`, `--order-by` and `--aggregate` strings, each optional.
struct QueryText {
    std::optional<std::string> where;
    std::optional<std::string> order_by;
    std::optional<std::string> aggregate;
};

/// At most one of each parsed spec. Built once, read-only afterwards.
struct QuerySpec {
    std::optional<ir::FilterSpec> where;
    std::optional<ir::SortSpec> order_by;
    std::optional<ir::AggregateSpec> aggregate;
};

struct AggregateResult {
    ir::AggregateSpec spec;
    double value = 0.0;
    std::size_t count = 0;

    /// `<operation> of <column> = <value>`
    [[nodiscard]] auto format() const -> std::string;
};

using QueryResult = std::variant<Dataset, AggregateResult>;
using QueryError = std::variant<parser::ParseError, ops::AggregationError>;

/// Parse every supplied expression; absent strings give absent specs.
[[nodiscard]] auto parse_query(const QueryText& text)
    -> std::expected<QuerySpec, parser::ParseError>;

/// Check that every spec names a column of `header`.
[[nodiscard]] auto validate_query(const QuerySpec& query, const std::vector<std::string>& header)
    -> std::expected<void, parser::ParseError>;

/// Run filter -> sort -> aggregate, skipping absent stages.
///
/// Columns are validated before any stage touches a row. The result is the
/// final Dataset, or an AggregateResult when an aggregate was requested.
[[nodiscard]] auto run_query(const Dataset& input, const QuerySpec& query)
    -> std::expected<QueryResult, QueryError>;

/// Human-readable message for any query error.
[[nodiscard]] auto describe(const QueryError& error) -> std::string;

}  // namespace csvq::runtime
