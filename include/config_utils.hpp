#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>
#include <vector>
#include "options.hpp"

namespace specflow {

/**
 * @brief Raw configuration values before validation.
 *
 * Scalars are keyed `section.key` (for example `parallel.stagger_delay_ms`);
 * top-level scalars use their bare key. Entries of `parallel.agents` are kept
 * as separate maps.
 */
struct ConfigValues {
    std::map<std::string, std::string> values;
    std::vector<std::map<std::string, std::string>> agents;
};

/**
 * @brief Load configuration values from a YAML file.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param out   Receives the values found.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the file was read and parsed.
 */
bool load_yaml_config(const std::string& path, ConfigValues& out, std::string& error);

/**
 * @brief Load configuration values from a JSON file.
 *
 * Same layout as @ref load_yaml_config.
 */
bool load_json_config(const std::string& path, ConfigValues& out, std::string& error);

/**
 * @brief Validate raw values and store them in @p opts.
 *
 * Keys that are not present keep their current value. An empty agent list
 * leaves the default `main` agent in place.
 */
bool apply_config(const ConfigValues& values, Options& opts, std::string& error);

/**
 * @brief Load a `.yaml`/`.yml` or `.json` file into @p opts.
 */
bool load_config_file(const std::string& path, Options& opts, std::string& error);

} // namespace specflow

#endif // CONFIG_UTILS_HPP
