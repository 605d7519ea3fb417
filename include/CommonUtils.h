#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace CommonUtils {

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n\f\v");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n\f\v");
    return std::string(s.substr(b, e - b + 1));
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline bool containsAny(std::string_view haystack, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (haystack.find(needle) != std::string_view::npos) return true;
    }
    return false;
}

inline bool isAllDigits(std::string_view s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

// Counts code points, not bytes. Continuation bytes (10xxxxxx) are skipped.
inline size_t utf8Length(std::string_view s) {
    size_t n = 0;
    for (unsigned char ch : s) {
        if ((ch & 0xC0u) != 0x80u) ++n;
    }
    return n;
}

// Truncates to at most maxChars code points without splitting a sequence.
inline std::string utf8Truncate(std::string_view s, size_t maxChars) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        const unsigned char ch = static_cast<unsigned char>(s[i]);
        if ((ch & 0xC0u) == 0x80u) continue;
        if (chars == maxChars) return std::string(s.substr(0, i));
        ++chars;
    }
    return std::string(s);
}

// Strict decimal/scientific parse of a whole token (surrounding whitespace allowed).
// Overflowing literals and "inf" spellings yield +/-infinity; "nan" is rejected.
inline std::optional<double> parseNumber(std::string_view raw) {
    std::string s = trim(raw);
    if (!s.empty() && s.front() == '+') s.erase(s.begin());
    if (s.empty() || s.front() == '+') return std::nullopt;

    double out = 0.0;
    const char* b = s.data();
    const char* e = b + s.size();
    const auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    if (p != e) return std::nullopt;
    if (ec == std::errc::result_out_of_range) {
        // strtod saturates to +/-HUGE_VAL on overflow and to 0 on underflow.
        return std::strtod(s.c_str(), nullptr);
    }
    if (ec != std::errc{} || std::isnan(out)) return std::nullopt;
    return out;
}

inline std::optional<double> parseFiniteNumber(std::string_view raw) {
    const auto v = parseNumber(raw);
    if (!v || !std::isfinite(*v)) return std::nullopt;
    return v;
}

// Integer-valued doubles print without a fractional part so that 1.0 and "1" compare equal.
// Distinct doubles always print differently.
inline std::string formatNumber(double v) {
    if (std::isnan(v)) return "nan";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";
    if (std::abs(v) < 1e15 && v == std::floor(v)) {
        return std::to_string(static_cast<long long>(v));
    }
    // Shortest of 15..17 significant digits that reads back as the same double.
    char buf[32];
    for (int precision = 15; precision < 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
        if (std::strtod(buf, nullptr) == v) return buf;
    }
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

inline double medianByNth(std::vector<double> values) {
    if (values.empty()) return 0.0;
    const size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    const double upper = values[mid];
    if (values.size() % 2 == 0) {
        std::nth_element(values.begin(), values.begin() + (mid - 1), values.begin() + mid);
        const long double lo = static_cast<long double>(values[mid - 1]);
        const long double hi = static_cast<long double>(upper);
        return static_cast<double>((lo + hi) / 2.0L);
    }
    return upper;
}

} // namespace CommonUtils
