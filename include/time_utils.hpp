#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format a duration in seconds as a short string like 1h2m3s.
 */
std::string format_duration_short(std::chrono::seconds dur);

/**
 * @brief Format a point in time as RFC3339 in UTC, e.g. `2026-01-25T10:04:11Z`.
 */
std::string format_rfc3339(std::chrono::system_clock::time_point tp);

/** @return Current time as RFC3339 UTC. */
std::string rfc3339_now();

/**
 * @brief Parse an RFC3339 timestamp.
 *
 * Accepts `YYYY-MM-DDTHH:MM:SS` followed by optional fractional seconds and
 * either `Z` or a numeric `+HH:MM`/`-HH:MM` offset.
 *
 * @param text Timestamp to parse.
 * @return The UTC time point or `std::nullopt` if @p text is malformed.
 */
std::optional<std::chrono::system_clock::time_point> parse_rfc3339(const std::string& text);

/** @return Milliseconds since the Unix epoch. */
std::uint64_t epoch_millis();

#endif // TIME_UTILS_HPP
