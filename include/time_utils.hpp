#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format a wall-clock time point as local YYYY-MM-DD HH:MM:SS.
 */
std::string format_time(std::chrono::system_clock::time_point tp);

/**
 * @brief Format a time point as an RFC 7231 HTTP date, e.g.
 * `Sun, 06 Nov 1994 08:49:37 GMT`.
 */
std::string http_date(std::chrono::system_clock::time_point tp);

/**
 * @brief Format a duration in seconds as a short string like 1h2m3s.
 */
std::string format_duration_short(std::chrono::seconds dur);

#endif // TIME_UTILS_HPP
