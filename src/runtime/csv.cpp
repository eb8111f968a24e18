#include <csvq/runtime/csv.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace csvq::runtime {

namespace {

auto io_error(std::string_view path, std::string message) -> IoError {
    return IoError{.path = std::string(path), .message = std::move(message)};
}

auto has_header_line(const std::string& path) -> bool {
    std::ifstream input{path};
    std::string line;
    while (std::getline(input, line)) {
        if (line.find_first_not_of(" \t\r") != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

auto IoError::format() const -> std::string {
    if (path.empty()) {
        return message;
    }
    return fmt::format("{}: {}", path, message);
}

auto read_csv(std::string_view path) -> std::expected<Dataset, IoError> {
    const std::string file{path};
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        return std::unexpected(io_error(path, "file not found"));
    }
    if (std::filesystem::is_directory(file, ec)) {
        return std::unexpected(io_error(path, "is a directory"));
    }
    if (!std::ifstream{file}) {
        return std::unexpected(io_error(path, "cannot open file for reading"));
    }
    if (!has_header_line(file)) {
        return std::unexpected(io_error(path, "csv has no header line"));
    }

    try {
        rapidcsv::Document doc(file,
                               rapidcsv::LabelParams(0, -1),   // row 0 = header, no row names
                               rapidcsv::SeparatorParams(','),  // handles RFC 4180 quoting
                               rapidcsv::ConverterParams(),
                               rapidcsv::LineReaderParams(false, '#', true)  // skip blank lines
        );

        auto headers = doc.GetColumnNames();
        if (headers.empty()) {
            return std::unexpected(io_error(path, "csv has no header line"));
        }
        std::unordered_set<std::string> seen;
        for (const auto& name : headers) {
            if (!seen.insert(name).second) {
                return std::unexpected(
                    io_error(path, fmt::format("duplicate column name '{}'", name)));
            }
        }

        Dataset data{headers};
        const std::size_t row_count = doc.GetRowCount();
        data.reserve(row_count);
        for (std::size_t r = 0; r < row_count; ++r) {
            auto cells = doc.GetRow<std::string>(r);
            if (cells.size() != headers.size()) {
                return std::unexpected(io_error(
                    path, fmt::format("record {} has {} fields, header has {}", r + 1,
                                      cells.size(), headers.size())));
            }
            data.add_row(std::move(cells));
        }
        spdlog::debug("read_csv {}: {} columns, {} rows", file, headers.size(),
                      data.row_count());
        return data;
    } catch (const std::exception& e) {
        return std::unexpected(io_error(path, fmt::format("cannot read csv: {}", e.what())));
    }
}

}  // namespace csvq::runtime
