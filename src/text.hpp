#pragma once
#include <algorithm>
#include <cctype>
#include <exception>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

inline std::string trim_copy(std::string_view s)
{
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    const auto first = std::find_if(s.begin(), s.end(), not_space);
    const auto last = std::find_if(s.rbegin(), s.rend(), not_space).base();
    if (first >= last) return {};
    return std::string(first, last);
}

inline std::string lower_copy(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

inline std::string upper_copy(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return s;
}

inline bool parse_double(std::string_view s, double* out)
{
    const std::string t = trim_copy(s);
    if (t.empty()) return false;

    try {
        std::size_t pos = 0;
        const double v = std::stod(t, &pos);
        if (pos != t.size()) return false;
        *out = v;
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}

inline bool parse_int(std::string_view s, int* out)
{
    const std::string t = trim_copy(s);
    if (t.empty()) return false;

    try {
        std::size_t pos = 0;
        const int v = std::stoi(t, &pos);
        if (pos != t.size()) return false;
        *out = v;
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}

// fixed, two decimals, no grouping ("1234.50", "-3.00")
inline std::string format_fixed2(double v)
{
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss << std::setprecision(2) << v;
    return oss.str();
}
