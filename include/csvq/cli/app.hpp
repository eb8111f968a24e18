#pragma once

#include <csvq/runtime/query.hpp>

#include <expected>
#include <iosfwd>
#include <string>

namespace CLI {
class App;
}  // namespace CLI

namespace csvq::cli {

inline constexpr const char* kVersion = "csvq 0.1.0";

/// Everything one invocation needs, filled in from the command line.
struct CliConfig {
    std::string file;
    runtime::QueryText query;
    bool verbose = false;
    /// Optional log file; the log always goes to stderr as well.
    std::string log_file;
};

/// Register the csvq options on `app`, binding them to `config`.
///
/// Every option may appear at most once.
void configure(CLI::App& app, CliConfig& config);

/// Install the stderr (and optional file) logger at the configured level.
[[nodiscard]] auto setup_logging(const CliConfig& config) -> std::expected<void, std::string>;

/// Load the file, run the query and print the result to `out`.
///
/// Errors are printed to `err` prefixed with "csvq: ". Returns the process
/// exit code (0 on success, 1 on any parse, aggregation or file error).
[[nodiscard]] auto run(const CliConfig& config, std::ostream& out, std::ostream& err) -> int;

}  // namespace csvq::cli
