#include "time_utils.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

std::string format_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::string timestamp() { return format_time(std::chrono::system_clock::now()); }

std::string http_date(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    // strftime's %a/%b follow the locale; HTTP dates must be English.
    static const char* const days[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char* const months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                         "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT", days[tm.tm_wday],
                  tm.tm_mday, months[tm.tm_mon], tm.tm_year + 1900, tm.tm_hour, tm.tm_min,
                  tm.tm_sec);
    return std::string(buf);
}

std::string format_duration_short(std::chrono::seconds dur) {
    long long total = dur.count();
    long long s = total % 60;
    long long m = (total / 60) % 60;
    long long h = (total / 3600) % 24;
    long long d = total / 86400;
    std::string out;
    if (d > 0)
        out += std::to_string(d) + "d";
    if (h > 0 || d > 0)
        out += std::to_string(h) + "h";
    if (m > 0 || h > 0 || d > 0)
        out += std::to_string(m) + "m";
    out += std::to_string(s) + "s";
    return out;
}
