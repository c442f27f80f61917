/**
 * @file specflow.cpp
 * @brief CLI entry point for the spec orchestrator.
 *
 * Parses the command line, prepares the `.specflow` state directory and the
 * logger, then dispatches to the command handlers in cli_commands.cpp.
 */

#include <filesystem>
#include <iostream>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "layout.hpp"
#include "logger.hpp"
#include "version.hpp"

namespace fs = std::filesystem;

static void start_logging(const fs::path& root, const specflow::LoggingOptions& log) {
    std::string path =
        log.log_file.empty() ? (specflow::logs_dir(root) / "specflow.log").string() : log.log_file;
    set_json_logging(log.json_log);
    set_log_compression(log.compress_logs);
    init_logger(path, log.log_level, log.max_log_size, log.max_log_files);
    if (log.use_syslog)
        init_syslog(log.syslog_facility);
}

/**
 * @brief Application entry point.
 *
 * @return Zero on success or when printing help/version; the command's exit
 *         code otherwise; 1 on unexpected errors.
 */
#ifndef SPECFLOW_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    try {
        cli::CliRequest req;
        std::string error;
        if (!cli::parse_cli(argc, argv, req, error)) {
            std::cerr << error << "\n";
            return 2;
        }
        if (req.show_version || req.command == "version") {
            std::cout << SPECFLOW_VERSION << "\n";
            return 0;
        }
        if (req.show_help || req.command.empty() || req.command == "help") {
            cli::print_help(std::cout, argv[0]);
            return req.show_help || req.command == "help" ? 0 : 2;
        }
        specflow::Options opts;
        if (!cli::load_options(req, opts, error)) {
            std::cerr << error << "\n";
            return 1;
        }
        if (!specflow::ensure_layout(req.root, error)) {
            std::cerr << error << "\n";
            return 1;
        }
        start_logging(req.root, opts.logging);
        log_debug("specflow " + std::string(SPECFLOW_VERSION) + " " + req.command,
                  LogFields{{"root", req.root.string()}});
        specflow::Project project(req.root, opts);
        int rc = cli::run_command(req, project, std::cout, std::cerr);
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
#endif // SPECFLOW_NO_MAIN
