#include <csvq/parser/expr.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>
#include <string>
#include <utility>

namespace csvq::parser {

namespace {

constexpr std::string_view kFilterOperators = "><=";
constexpr std::array<std::string_view, 4> kUnsupportedFollowing = {">=", "<=", "<>", "=="};

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto malformed(std::string_view expression, std::string message) -> ParseError {
    return ParseError{.kind = ParseErrorKind::MalformedExpression,
                      .message = std::move(message),
                      .expression = std::string(expression)};
}

struct Assignment {
    std::string_view lhs;
    std::string_view rhs;
};

/// Split `<lhs>=<rhs>` on the first '='; both sides trimmed and non-empty.
auto split_assignment(std::string_view text, std::string_view what, std::string_view usage)
    -> ParseResult<Assignment> {
    auto eq = text.find('=');
    if (eq == std::string_view::npos) {
        return std::unexpected(
            malformed(text, fmt::format("expected {} of the form {}", what, usage)));
    }
    auto lhs = trim(text.substr(0, eq));
    auto rhs = trim(text.substr(eq + 1));
    if (lhs.empty()) {
        return std::unexpected(malformed(text, fmt::format("missing column name in {}", what)));
    }
    if (rhs.empty()) {
        return std::unexpected(
            malformed(text, fmt::format("missing value after '=' in {}, expected {}", what,
                                        usage)));
    }
    return Assignment{.lhs = lhs, .rhs = rhs};
}

}  // namespace

auto ParseError::format() const -> std::string {
    if (expression.empty()) {
        return message;
    }
    return fmt::format("{} in '{}'", message, expression);
}

auto parse_filter(std::string_view text) -> ParseResult<ir::FilterSpec> {
    auto expr = trim(text);
    auto pos = expr.find_first_of(kFilterOperators);
    if (pos == std::string_view::npos) {
        return std::unexpected(
            malformed(text, "no comparison operator found, use one of '>', '<', '='"));
    }

    if (pos + 1 < expr.size()) {
        auto pair = expr.substr(pos, 2);
        for (auto unsupported : kUnsupportedFollowing) {
            if (pair == unsupported) {
                return std::unexpected(malformed(
                    text,
                    fmt::format("unsupported operator '{}', use one of '>', '<', '='", pair)));
            }
        }
    }
    if (pos > 0 && expr[pos] == '=' && expr[pos - 1] == '!') {
        return std::unexpected(
            malformed(text, "unsupported operator '!=', use one of '>', '<', '='"));
    }

    auto column = trim(expr.substr(0, pos));
    auto operand = trim(expr.substr(pos + 1));
    if (column.empty()) {
        return std::unexpected(malformed(text, "missing column name before operator"));
    }
    if (operand.empty()) {
        return std::unexpected(malformed(text, "missing value after operator"));
    }

    ir::CompareOp op = ir::CompareOp::Eq;
    switch (expr[pos]) {
        case '>':
            op = ir::CompareOp::Gt;
            break;
        case '<':
            op = ir::CompareOp::Lt;
            break;
        default:
            op = ir::CompareOp::Eq;
            break;
    }
    return ir::FilterSpec{
        .column = std::string(column), .op = op, .operand = std::string(operand)};
}

auto parse_order_by(std::string_view text) -> ParseResult<ir::SortSpec> {
    auto parts = split_assignment(text, "order-by", "<column>=<asc|desc>");
    if (!parts) {
        return std::unexpected(std::move(parts.error()));
    }
    ir::SortDirection direction = ir::SortDirection::Asc;
    if (parts->rhs == "asc") {
        direction = ir::SortDirection::Asc;
    } else if (parts->rhs == "desc") {
        direction = ir::SortDirection::Desc;
    } else {
        return std::unexpected(malformed(
            text, fmt::format("unknown sort direction '{}', use 'asc' or 'desc'", parts->rhs)));
    }
    return ir::SortSpec{.column = std::string(parts->lhs), .direction = direction};
}

auto parse_aggregate(std::string_view text) -> ParseResult<ir::AggregateSpec> {
    auto parts = split_assignment(text, "aggregate", "<column>=<avg|min|max>");
    if (!parts) {
        return std::unexpected(std::move(parts.error()));
    }
    ir::AggFunc func = ir::AggFunc::Avg;
    if (parts->rhs == "avg") {
        func = ir::AggFunc::Avg;
    } else if (parts->rhs == "min") {
        func = ir::AggFunc::Min;
    } else if (parts->rhs == "max") {
        func = ir::AggFunc::Max;
    } else {
        return std::unexpected(malformed(
            text,
            fmt::format("unknown aggregate operation '{}', use 'avg', 'min' or 'max'",
                        parts->rhs)));
    }
    return ir::AggregateSpec{.column = std::string(parts->lhs), .func = func};
}

auto validate_column(std::string_view column, const std::vector<std::string>& header,
                     std::string_view expression) -> ParseResult<void> {
    for (const auto& name : header) {
        if (name == column) {
            return {};
        }
    }
    return std::unexpected(ParseError{
        .kind = ParseErrorKind::UnknownColumn,
        .message = fmt::format("unknown column '{}' (available: {})", column,
                               fmt::join(header, ", ")),
        .expression = std::string(expression),
    });
}

}  // namespace csvq::parser
