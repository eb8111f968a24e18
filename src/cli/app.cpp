#include <csvq/cli/app.hpp>
#include <csvq/runtime/csv.hpp>
#include <csvq/runtime/ops.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace csvq::cli {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;

auto is_blank(const std::string& text) -> bool {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

auto has_csv_extension(const std::string& path) -> bool {
    auto ext = std::filesystem::path(path).extension().string();
    for (auto& ch : ext) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return ext == ".csv";
}

auto plural(std::size_t n) -> const char* {
    return n == 1 ? "" : "s";
}

}  // namespace

void configure(CLI::App& app, CliConfig& config) {
    app.set_version_flag("--version", kVersion);
    app.footer(
        "Examples:\n"
        "  csvq --file data.csv --where 'price>100'\n"
        "  csvq --file data.csv --order-by 'price=desc'\n"
        "  csvq --file data.csv --where 'brand=apple' --aggregate 'price=avg'\n"
        "\n"
        "Filter operators: >, <, =    Sort: asc, desc    Aggregates: avg, min, max");

    app.add_option("--file", config.file, "CSV file with a header row")
        ->required()
        ->multi_option_policy(CLI::MultiOptionPolicy::Throw);
    app.add_option("--where", config.query.where, "Filter: <column><op><value>, op one of > < =")
        ->multi_option_policy(CLI::MultiOptionPolicy::Throw);
    app.add_option("--order-by", config.query.order_by, "Sort: <column>=<asc|desc>")
        ->multi_option_policy(CLI::MultiOptionPolicy::Throw);
    app.add_option("--aggregate", config.query.aggregate, "Aggregate: <column>=<avg|min|max>")
        ->multi_option_policy(CLI::MultiOptionPolicy::Throw);
    app.add_flag("-v,--verbose", config.verbose, "Enable debug logging on stderr");
    app.add_option("--log-file", config.log_file, "Also write the log to this file")
        ->multi_option_policy(CLI::MultiOptionPolicy::Throw);
}

auto setup_logging(const CliConfig& config) -> std::expected<void, std::string> {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!config.log_file.empty()) {
        try {
            sinks.push_back(
                std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file, false));
        } catch (const spdlog::spdlog_ex& e) {
            return std::unexpected(
                fmt::format("cannot open log file '{}': {}", config.log_file, e.what()));
        }
    }
    auto logger = std::make_shared<spdlog::logger>("csvq", sinks.begin(), sinks.end());
    spdlog::set_default_logger(std::move(logger));
    if (config.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    return {};
}

auto run(const CliConfig& config, std::ostream& out, std::ostream& err) -> int {
    runtime::QueryText text = config.query;
    if (text.where.has_value() && is_blank(*text.where)) {
        spdlog::debug("blank --where, no filter applied");
        text.where.reset();
    }

    // Expressions are checked before the file is touched.
    auto query = runtime::parse_query(text);
    if (!query) {
        spdlog::debug("parse failed: {}", query.error().format());
        err << "csvq: " << query.error().format() << "\n";
        return kExitFailure;
    }

    if (!has_csv_extension(config.file)) {
        spdlog::warn("'{}' does not have a .csv extension", config.file);
    }
    auto data = runtime::read_csv(config.file);
    if (!data) {
        err << "csvq: " << data.error().format() << "\n";
        return kExitFailure;
    }

    auto result = runtime::run_query(*data, *query);
    if (!result) {
        err << "csvq: " << runtime::describe(result.error()) << "\n";
        return kExitFailure;
    }

    if (const auto* agg = std::get_if<runtime::AggregateResult>(&*result)) {
        spdlog::debug("{} values aggregated", agg->count);
        out << agg->format() << "\n";
        return kExitOk;
    }
    const auto& rows = std::get<Dataset>(*result);
    ops::print(rows, out);
    if (!rows.empty()) {
        out << fmt::format("({} row{})\n", rows.row_count(), plural(rows.row_count()));
    }
    return kExitOk;
}

}  // namespace csvq::cli
