#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include "arg_parser.hpp"

/**
 * @brief Parse an unsigned decimal number within `[min, max]`.
 *
 * Used for config values such as `parallel.max_parallel` and
 * `agents[].max_concurrent`.
 *
 * @param ok Set to `false` on non-digits or an out-of-range value.
 * @return The parsed value, or `0` when @p ok is `false`.
 */
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);

/** Read @p flag from @p parser and parse it as above; a missing flag is not ok. */
size_t parse_size_t(const ArgParser& parser, const std::string& flag, size_t min, size_t max,
                    bool& ok);

/** Parse a whole-string floating-point value within `[min, max]`. */
double parse_double(const std::string& value, double min, double max, bool& ok);

/** `true/false`, `yes/no`, `on/off` or `1/0`, case-insensitive. */
bool parse_bool(const std::string& value, bool& ok);

/**
 * @brief Parse a byte count such as `512`, `10K` or `5MB` for `logging.max_size`.
 *
 * Suffixes `B`, `K`/`KB`, `M`/`MB` and `G`/`GB` are binary multiples.
 */
size_t parse_bytes(const std::string& value, bool& ok);

/**
 * @brief Parse a duration such as `90`, `30m` or `2h` for
 * `recovery.stale_after_seconds`.
 *
 * A bare number is seconds; `m`, `h` and `d` select minutes, hours and days.
 */
std::chrono::seconds parse_duration(const std::string& value, bool& ok);

#endif // PARSE_UTILS_HPP
