#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>

static bool all_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool to_ull(const std::string& digits, unsigned long long& out) {
    if (!all_digits(digits))
        return false;
    try {
        out = std::stoull(digits);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

unsigned int parse_uint(const std::string& value, unsigned int min, unsigned int max, bool& ok) {
    ok = false;
    unsigned long long v = 0;
    if (!to_ull(value, v) || v < min || v > max)
        return 0;
    ok = true;
    return static_cast<unsigned int>(v);
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    unsigned long long v = 0;
    if (!to_ull(value, v) || v < min || v > max)
        return 0;
    ok = true;
    return static_cast<size_t>(v);
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = lower(value);
    if (!val.empty() && val.back() == 'b')
        val.pop_back();
    unsigned long long mult = 1;
    if (!val.empty()) {
        switch (val.back()) {
        case 'k':
            mult = 1024ull;
            break;
        case 'm':
            mult = 1024ull * 1024;
            break;
        case 'g':
            mult = 1024ull * 1024 * 1024;
            break;
        default:
            break;
        }
        if (mult != 1)
            val.pop_back();
    }
    unsigned long long base = 0;
    if (!to_ull(val, base) || base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}

std::chrono::seconds parse_duration(const std::string& value, bool& ok) {
    ok = false;
    if (value.empty())
        return std::chrono::seconds(0);
    char unit = value.back();
    std::string num = value;
    if (unit == 's' || unit == 'm' || unit == 'h' || unit == 'd' || unit == 'w')
        num.pop_back();
    else if (std::isdigit(static_cast<unsigned char>(unit)))
        unit = 's';
    else
        return std::chrono::seconds(0);
    unsigned long long n = 0;
    if (!to_ull(num, n) || n > static_cast<unsigned long long>(INT_MAX))
        return std::chrono::seconds(0);
    ok = true;
    long long v = static_cast<long long>(n);
    switch (unit) {
    case 'm':
        return std::chrono::minutes(v);
    case 'h':
        return std::chrono::hours(v);
    case 'd':
        return std::chrono::hours(24 * v);
    case 'w':
        return std::chrono::hours(24 * 7 * v);
    default:
        return std::chrono::seconds(v);
    }
}

bool parse_bool(const std::string& value, bool& ok) {
    ok = true;
    std::string v = lower(value);
    if (v.empty() || v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    ok = false;
    return false;
}
