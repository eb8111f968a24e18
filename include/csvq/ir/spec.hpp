#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace csvq::ir {

/// Single-character comparison operators accepted by `--where`.
enum class CompareOp : std::uint8_t {
    Gt,
    Lt,
    Eq,
};

enum class SortDirection : std::uint8_t {
    Asc,
    Desc,
};

enum class AggFunc : std::uint8_t {
    Avg,
    Min,
    Max,
};

/// `<column><op><operand>`; the operand is kept raw and typed at evaluation.
struct FilterSpec {
    std::string column;
    CompareOp op = CompareOp::Eq;
    std::string operand;
};

/// `<column>=<asc|desc>`
struct SortSpec {
    std::string column;
    SortDirection direction = SortDirection::Asc;
};

/// `<column>=<avg|min|max>`
struct AggregateSpec {
    std::string column;
    AggFunc func = AggFunc::Avg;
};

[[nodiscard]] constexpr auto to_string(CompareOp op) noexcept -> std::string_view {
    switch (op) {
        case CompareOp::Gt:
            return ">";
        case CompareOp::Lt:
            return "<";
        case CompareOp::Eq:
            return "=";
    }
    return "?";
}

[[nodiscard]] constexpr auto to_string(SortDirection direction) noexcept -> std::string_view {
    return direction == SortDirection::Asc ? "asc" : "desc";
}

[[nodiscard]] constexpr auto to_string(AggFunc func) noexcept -> std::string_view {
    switch (func) {
        case AggFunc::Avg:
            return "avg";
        case AggFunc::Min:
            return "min";
        case AggFunc::Max:
            return "max";
    }
    return "?";
}

}  // namespace csvq::ir
