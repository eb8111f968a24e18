#include <csvq/core/dataset.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <utility>

namespace csvq {

Dataset::Dataset(std::vector<std::string> columns) : columns_(std::move(columns)) {
    index_.reserve(columns_.size());
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (!index_.emplace(columns_[i], i).second) {
            throw std::invalid_argument(fmt::format("duplicate column name '{}'", columns_[i]));
        }
    }
}

void Dataset::add_row(Row row) {
    if (row.size() != columns_.size()) {
        throw std::invalid_argument(fmt::format("row has {} cells, expected {}", row.size(),
                                                columns_.size()));
    }
    rows_.push_back(std::move(row));
}

auto Dataset::empty_like() const -> Dataset {
    Dataset out;
    out.columns_ = columns_;
    out.index_ = index_;
    return out;
}

auto Dataset::column_index(std::string_view name) const -> std::optional<std::size_t> {
    if (auto it = index_.find(std::string(name)); it != index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto Dataset::column_at(std::string_view name) const -> std::size_t {
    auto col = column_index(name);
    if (!col.has_value()) {
        throw std::out_of_range(fmt::format("unknown column '{}'", name));
    }
    return *col;
}

auto Dataset::cell(std::size_t row, std::string_view name) const -> const std::string& {
    return rows_.at(row)[column_at(name)];
}

}  // namespace csvq
