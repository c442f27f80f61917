#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>

static bool all_digits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

static std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (!all_digits(value))
        return 0;
    try {
        unsigned long long v = std::stoull(value);
        if (v < min || v > max)
            return 0;
        ok = true;
        return static_cast<size_t>(v);
    } catch (const std::exception&) {
        return 0;
    }
}

size_t parse_size_t(const ArgParser& parser, const std::string& flag, size_t min, size_t max,
                    bool& ok) {
    if (!parser.has_flag(flag)) {
        ok = false;
        return 0;
    }
    return parse_size_t(parser.get_option(flag), min, max, ok);
}

double parse_double(const std::string& value, double min, double max, bool& ok) {
    ok = false;
    try {
        size_t used = 0;
        double v = std::stod(value, &used);
        if (used != value.size() || v < min || v > max)
            return 0.0;
        ok = true;
        return v;
    } catch (const std::exception&) {
        return 0.0;
    }
}

bool parse_bool(const std::string& value, bool& ok) {
    std::string v = lower(value);
    ok = true;
    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;
    ok = false;
    return false;
}

size_t parse_bytes(const std::string& value, bool& ok) {
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
    if (!all_digits(val))
        return 0;
    unsigned long long base = 0;
    try {
        base = std::stoull(val);
    } catch (const std::exception&) {
        return 0;
    }
    if (base > ULLONG_MAX / mult)
        return 0;
    ok = true;
    return static_cast<size_t>(base * mult);
}

std::chrono::seconds parse_duration(const std::string& value, bool& ok) {
    ok = false;
    if (value.empty())
        return std::chrono::seconds(0);
    char unit = value.back();
    std::string num = value;
    if (unit == 's' || unit == 'm' || unit == 'h' || unit == 'd')
        num.pop_back();
    else if (std::isdigit(static_cast<unsigned char>(unit)))
        unit = 's';
    else
        return std::chrono::seconds(0);
    if (!all_digits(num))
        return std::chrono::seconds(0);
    long long n = 0;
    try {
        n = std::stoll(num);
    } catch (const std::exception&) {
        return std::chrono::seconds(0);
    }
    ok = true;
    switch (unit) {
    case 'm':
        return std::chrono::minutes(n);
    case 'h':
        return std::chrono::hours(n);
    case 'd':
        return std::chrono::hours(24 * n);
    default:
        return std::chrono::seconds(n);
    }
}
