#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "logger.hpp"
#include "options.hpp"
#include "project.hpp"

namespace cli {

/** Parsed command line. */
struct CliRequest {
    std::string command;
    std::vector<std::string> args;
    std::filesystem::path root;
    std::string config_path;
    std::string log_file;
    std::optional<LogLevel> log_level;
    bool force = false;
    size_t parallel = 0;
    bool show_help = false;
    bool show_version = false;
};

/**
 * @brief Parse `specflow <command> [args] [options]`.
 *
 * @return `false` with @p error set on unknown flags or bad values.
 */
bool parse_cli(int argc, char* argv[], CliRequest& req, std::string& error);

/**
 * @brief Build the runtime options for @p req.
 *
 * Reads `--config`, or `<state_dir>/config.yaml` / `config.json` when present,
 * then applies command line overrides.
 */
bool load_options(const CliRequest& req, specflow::Options& opts, std::string& error);

void print_help(std::ostream& os, const char* prog);

/**
 * @brief Execute one command.
 *
 * @return Process exit code.
 */
int run_command(const CliRequest& req, specflow::Project& project, std::ostream& out,
                std::ostream& err);

} // namespace cli
