#include <csvq/cli/app.hpp>

#include <CLI/CLI.hpp>

#include <iostream>

auto main(int argc, char** argv) -> int {
    CLI::App app{"csvq — filter, sort and aggregate CSV files"};

    csvq::cli::CliConfig config;
    csvq::cli::configure(app, config);

    CLI11_PARSE(app, argc, argv);

    if (auto logging = csvq::cli::setup_logging(config); !logging) {
        std::cerr << "csvq: " << logging.error() << "\n";
        return 1;
    }

    return csvq::cli::run(config, std::cout, std::cerr);
}
