#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace csvq {

/// Inferred representation of a raw CSV cell.
///
/// A cell is numeric when the whole text parses as a decimal number,
/// otherwise it keeps its raw text unchanged.
using TypedValue = std::variant<double, std::string>;

/// Result of comparing two TypedValues.
enum class Ordering : std::uint8_t {
    Less,
    Equal,
    Greater,
};

/// Parse `text` as a finite decimal number.
///
/// Accepts an optional sign, an optional fractional part and an optional
/// exponent. Surrounding whitespace, the empty string, nan/inf and hex
/// forms are rejected.
[[nodiscard]] auto try_parse_number(std::string_view text, double& out) -> bool;

/// Infer the TypedValue of a raw cell.
[[nodiscard]] auto parse_typed(std::string_view raw) -> TypedValue;

/// Compare two raw cells.
///
/// When both sides parse as numbers they compare numerically (exact equality,
/// no epsilon). Otherwise the raw texts compare bytewise, so "$500" < "100"
/// and "9" > "10a".
[[nodiscard]] auto compare_typed(std::string_view lhs, std::string_view rhs) -> Ordering;

/// Total order over TypedValues, used for sorting.
///
/// Same-kind pairs compare as in compare_typed; any numeric value is Less
/// than any string value so that a mixed column still sorts consistently.
[[nodiscard]] auto sort_order(const TypedValue& lhs, const TypedValue& rhs) noexcept -> Ordering;

[[nodiscard]] inline auto is_numeric(const TypedValue& value) noexcept -> bool {
    return std::holds_alternative<double>(value);
}

}  // namespace csvq
