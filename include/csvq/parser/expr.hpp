#pragma once

#include <csvq/ir/spec.hpp>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace csvq::parser {

enum class ParseErrorKind : std::uint8_t {
    MalformedExpression,
    UnknownColumn,
};

/// Parse error carrying the offending expression text.
struct ParseError {
    ParseErrorKind kind = ParseErrorKind::MalformedExpression;
    std::string message;
    std::string expression;

    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using ParseResult = std::expected<T, ParseError>;

/// Parse a `--where` expression: `<column><op><operand>` with op one of
/// `>`, `<`, `=`. Two-character operators (`>=`, `<=`, `<>`, `!=`, `==`) are
/// rejected rather than split into a one-character operator and an operand
/// starting with `=`.
[[nodiscard]] auto parse_filter(std::string_view text) -> ParseResult<ir::FilterSpec>;

/// Parse an `--order-by` expression: `<column>=<asc|desc>`.
[[nodiscard]] auto parse_order_by(std::string_view text) -> ParseResult<ir::SortSpec>;

/// Parse an `--aggregate` expression: `<column>=<avg|min|max>`.
[[nodiscard]] auto parse_aggregate(std::string_view text) -> ParseResult<ir::AggregateSpec>;

/// Fail with UnknownColumn unless `column` is one of `header`.
[[nodiscard]] auto validate_column(std::string_view column,
                                   const std::vector<std::string>& header,
                                   std::string_view expression) -> ParseResult<void>;

}  // namespace csvq::parser
