#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <ctime>
#include <optional>
#include <string>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format a Unix time as local YYYY-MM-DD HH:MM:SS.
 */
std::string format_local_time(std::time_t t);

/**
 * @brief Current Unix time in whole seconds.
 */
std::time_t unix_now();

/**
 * @brief Parse an ISO-8601 UTC timestamp such as `2016-07-11T22:14:10Z`.
 *
 * Fractional seconds are ignored. A trailing `Z` or a `+00:00` offset is
 * accepted; any other offset is applied to the result.
 *
 * @return Unix time or `std::nullopt` if @a text is not a timestamp.
 */
std::optional<std::time_t> parse_iso8601_utc(const std::string& text);

#endif // TIME_UTILS_HPP
