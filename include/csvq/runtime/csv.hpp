#pragma once

#include <csvq/core/dataset.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace csvq::runtime {

/// File-layer failure: missing/unreadable file, no header, ragged rows.
struct IoError {
    std::string path;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

/// Read an RFC 4180 CSV file whose first line is the header.
///
/// Cells are kept as raw strings; typing happens per query stage. Blank lines
/// are skipped.
[[nodiscard]] auto read_csv(std::string_view path) -> std::expected<Dataset, IoError>;

}  // namespace csvq::runtime
