/**
 * @file main.cpp
 * @brief Entry point for the dental_desk application
 *
 * Usage:
 *   dental_desk [OPTIONS]
 *
 * Options:
 *   --config <file>           YAML configuration file
 *   --db-path <path>          Database path (default: ./dentistry_clinic.db)
 *   --log-level <level>       Log level (default: info)
 *   --log-dir <path>          Log directory (default: logs)
 *   --refresh-interval <sec>  Seconds between refreshes (default: 60)
 *   --no-reminders            Disable the periodic refresh
 *   --help                    Show help message
 */

#include "config.hpp"
#include "desk_app.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    auto config = dental::desk::desk_config::parse_args(argc, argv);
    if (config.is_err()) {
        std::cerr << "Error: " << config.error().message << "\n";
        return 1;
    }

    if (config.value().show_help) {
        dental::desk::desk_config::print_help();
        return 0;
    }

    dental::desk::desk_app app(config.value(), std::cin, std::cout);

    auto init = app.initialize();
    if (init.is_err()) {
        std::cerr << "Failed to start dental_desk: " << init.error().message << "\n";
        return 1;
    }

    auto exit_code = app.run();
    app.shutdown();
    return exit_code;
}
