#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace csvq {

/// One record: a raw cell per header column, in header order.
using Row = std::vector<std::string>;

/// A header plus an ordered sequence of rows loaded from one CSV file.
///
/// Every row holds exactly one cell per column. Query stages never mutate a
/// Dataset in place; they build a new one with `empty_like` + `add_row`.
class Dataset {
   public:
    Dataset() = default;

    /// Column names must be unique; throws std::invalid_argument otherwise.
    explicit Dataset(std::vector<std::string> columns);

    /// Append a row. Throws std::invalid_argument on a width mismatch.
    void add_row(Row row);

    /// A dataset with the same header and no rows.
    [[nodiscard]] auto empty_like() const -> Dataset;

    [[nodiscard]] auto columns() const noexcept -> const std::vector<std::string>& {
        return columns_;
    }
    [[nodiscard]] auto rows() const noexcept -> const std::vector<Row>& { return rows_; }
    [[nodiscard]] auto row_count() const noexcept -> std::size_t { return rows_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return rows_.empty(); }

    /// Position of `name` in the header.
    [[nodiscard]] auto column_index(std::string_view name) const -> std::optional<std::size_t>;

    /// Position of `name` in the header; throws std::out_of_range if absent.
    [[nodiscard]] auto column_at(std::string_view name) const -> std::size_t;

    [[nodiscard]] auto has_column(std::string_view name) const -> bool {
        return column_index(name).has_value();
    }

    /// Cell of `row` under column `name` (bounds-checked, throws std::out_of_range).
    [[nodiscard]] auto cell(std::size_t row, std::string_view name) const -> const std::string&;

    void reserve(std::size_t rows) { rows_.reserve(rows); }

   private:
    std::vector<std::string> columns_;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<Row> rows_;
};

}  // namespace csvq
