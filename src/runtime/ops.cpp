#include <csvq/core/value.hpp>
#include <csvq/runtime/ops.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <numeric>
#include <string>
#include <vector>

namespace csvq::ops {

namespace {

auto keeps(Ordering cmp, ir::CompareOp op) noexcept -> bool {
    switch (op) {
        case ir::CompareOp::Gt:
            return cmp == Ordering::Greater;
        case ir::CompareOp::Lt:
            return cmp == Ordering::Less;
        case ir::CompareOp::Eq:
            return cmp == Ordering::Equal;
    }
    return false;
}

}  // namespace

auto AggregationError::format() const -> std::string {
    return message;
}

// ─── Query stages ─────────────────────────────────────────────────────────────

auto filter(const Dataset& input, const ir::FilterSpec& spec) -> Dataset {
    const std::size_t col = input.column_at(spec.column);
    Dataset output = input.empty_like();
    for (const auto& row : input.rows()) {
        if (keeps(compare_typed(row[col], spec.operand), spec.op)) {
            output.add_row(row);
        }
    }
    spdlog::debug("filter {}{}{}: {} of {} rows kept", spec.column, ir::to_string(spec.op),
                  spec.operand, output.row_count(), input.row_count());
    return output;
}

auto order(const Dataset& input, const ir::SortSpec& spec) -> Dataset {
    const std::size_t col = input.column_at(spec.column);
    std::size_t rows = input.row_count();
    if (rows <= 1) {
        return input;
    }

    // Type each key once; the comparator still dispatches per pair, so a
    // mixed column orders numbers before strings.
    std::vector<TypedValue> keys;
    keys.reserve(rows);
    for (const auto& row : input.rows()) {
        keys.push_back(parse_typed(row[col]));
    }

    const bool ascending = spec.direction == ir::SortDirection::Asc;
    auto compare_row = [&](std::size_t lhs, std::size_t rhs) -> bool {
        auto cmp = sort_order(keys[lhs], keys[rhs]);
        return ascending ? cmp == Ordering::Less : cmp == Ordering::Greater;
    };
    std::vector<std::size_t> idx(rows);
    std::iota(idx.begin(), idx.end(), 0);
    std::stable_sort(idx.begin(), idx.end(), compare_row);

    Dataset output = input.empty_like();
    output.reserve(rows);
    for (auto i : idx) {
        output.add_row(input.rows()[i]);
    }
    spdlog::debug("order by {} {}: {} rows", spec.column, ir::to_string(spec.direction), rows);
    return output;
}

auto aggregate(const Dataset& input, const ir::AggregateSpec& spec)
    -> std::expected<double, AggregationError> {
    const std::size_t col = input.column_at(spec.column);
    if (input.empty()) {
        return std::unexpected(AggregationError{
            .kind = AggregationErrorKind::EmptyInput,
            .column = spec.column,
            .message = fmt::format("cannot compute {} of '{}': no rows to aggregate",
                                   ir::to_string(spec.func), spec.column),
        });
    }

    double sum = 0.0;
    double min = std::numeric_limits<double>::infinity();
    double max = -std::numeric_limits<double>::infinity();
    const auto& rows = input.rows();
    for (std::size_t r = 0; r < rows.size(); ++r) {
        double value = 0.0;
        if (!try_parse_number(rows[r][col], value)) {
            return std::unexpected(AggregationError{
                .kind = AggregationErrorKind::NonNumericColumn,
                .column = spec.column,
                .message =
                    fmt::format("cannot compute {} of '{}': row {} has non-numeric value '{}'",
                                ir::to_string(spec.func), spec.column, r + 1, rows[r][col]),
            });
        }
        sum += value;
        min = std::min(min, value);
        max = std::max(max, value);
    }

    switch (spec.func) {
        case ir::AggFunc::Avg:
            return sum / static_cast<double>(rows.size());
        case ir::AggFunc::Min:
            return min;
        case ir::AggFunc::Max:
            return max;
    }
    return sum / static_cast<double>(rows.size());
}

// ─── Rendering ────────────────────────────────────────────────────────────────

auto format_number(double value) -> std::string {
    return fmt::format("{}", value);
}

void print(const Dataset& data, std::ostream& out) {
    const auto& columns = data.columns();
    if (columns.empty() || data.empty()) {
        out << "(no rows)\n";
        return;
    }

    std::vector<std::size_t> widths(columns.size());
    for (std::size_t c = 0; c < columns.size(); ++c) {
        widths[c] = columns[c].size();
        for (const auto& row : data.rows()) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    // Header row.
    for (std::size_t c = 0; c < columns.size(); ++c) {
        if (c > 0)
            out << "  ";
        out << fmt::format("{:<{}}", columns[c], widths[c]);
    }
    out << "\n";

    // Separator.
    for (std::size_t c = 0; c < columns.size(); ++c) {
        if (c > 0)
            out << "  ";
        out << std::string(widths[c], '-');
    }
    out << "\n";

    // Data rows.
    for (const auto& row : data.rows()) {
        for (std::size_t c = 0; c < columns.size(); ++c) {
            if (c > 0)
                out << "  ";
            out << fmt::format("{:<{}}", row[c], widths[c]);
        }
        out << "\n";
    }
}

}  // namespace csvq::ops
