#include <csvq/core/value.hpp>

#include <charconv>
#include <cmath>
#include <string>
#include <system_error>

namespace csvq {

namespace {

auto three_way(double lhs, double rhs) noexcept -> Ordering {
    if (lhs < rhs)
        return Ordering::Less;
    if (lhs > rhs)
        return Ordering::Greater;
    return Ordering::Equal;
}

auto three_way(std::string_view lhs, std::string_view rhs) noexcept -> Ordering {
    int cmp = lhs.compare(rhs);
    if (cmp < 0)
        return Ordering::Less;
    if (cmp > 0)
        return Ordering::Greater;
    return Ordering::Equal;
}

}  // namespace

auto try_parse_number(std::string_view text, double& out) -> bool {
    // from_chars rejects a leading '+', strip it here so "+5" and "5" agree.
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (text.empty() || text.front() == '-' || text.front() == '+') {
            return false;
        }
    }
    if (text.empty()) {
        return false;
    }
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    double value = 0.0;
    auto result = std::from_chars(begin, end, value, std::chars_format::general);
    if (result.ec != std::errc() || result.ptr != end) {
        return false;
    }
    if (!std::isfinite(value)) {
        return false;
    }
    out = value;
    return true;
}

auto parse_typed(std::string_view raw) -> TypedValue {
    double number = 0.0;
    if (try_parse_number(raw, number)) {
        return TypedValue{number};
    }
    return TypedValue{std::string(raw)};
}

auto compare_typed(std::string_view lhs, std::string_view rhs) -> Ordering {
    double l_num = 0.0;
    double r_num = 0.0;
    if (try_parse_number(lhs, l_num) && try_parse_number(rhs, r_num)) {
        return three_way(l_num, r_num);
    }
    return three_way(lhs, rhs);
}

auto sort_order(const TypedValue& lhs, const TypedValue& rhs) noexcept -> Ordering {
    const auto* l_num = std::get_if<double>(&lhs);
    const auto* r_num = std::get_if<double>(&rhs);
    if (l_num != nullptr && r_num != nullptr) {
        return three_way(*l_num, *r_num);
    }
    if (l_num != nullptr) {
        return Ordering::Less;
    }
    if (r_num != nullptr) {
        return Ordering::Greater;
    }
    return three_way(std::get<std::string>(lhs), std::get<std::string>(rhs));
}

}  // namespace csvq
