#pragma once

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

namespace svgcore {

// =============================================================================
// Whitespace
// =============================================================================

inline bool isXmlSpace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

inline bool isWhitespaceOnly(std::string_view s) noexcept {
    for (const char c : s) {
        if (!isXmlSpace(c)) return false;
    }
    return true;
}

inline std::string_view trimView(std::string_view s) noexcept {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && isXmlSpace(s[b])) b++;
    while (e > b && isXmlSpace(s[e - 1])) e--;
    return s.substr(b, e - b);
}

inline std::string toLowerAscii(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

inline bool startsWith(std::string_view s, std::string_view prefix) noexcept {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// =============================================================================
// Numbers
// =============================================================================

/**
 * Reads the leading number of an attribute value ("12.5px" -> 12.5).
 * Returns fallback when the value does not start with a number.
 */
inline double parseLeadingNumber(std::string_view s, double fallback = 0.0) {
    const std::string_view t = trimView(s);
    if (t.empty()) return fallback;
    const std::string buf(t);
    char* end = nullptr;
    const double v = std::strtod(buf.c_str(), &end);
    if (end == buf.c_str() || !std::isfinite(v)) return fallback;
    return v;
}

/**
 * Shortest stable decimal form used for every geometry write-back.
 * 10 significant digits absorbs binary noise from repeated +delta/-delta.
 */
inline std::string formatNumber(double v) {
    if (!std::isfinite(v)) return "0";
    if (std::fabs(v) < 1e-10) return "0";
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%.10g", v);
    return std::string(buf);
}

// Strict form: optional sign, digits, optional fraction. No exponent, no unit.
inline bool isPlainNumber(std::string_view s) noexcept {
    std::size_t i = 0;
    if (i < s.size() && s[i] == '-') i++;
    const std::size_t digitsStart = i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) i++;
    if (i == digitsStart) return false;
    if (i < s.size() && s[i] == '.') {
        i++;
        const std::size_t fracStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) i++;
        if (i == fracStart) return false;
    }
    return i == s.size();
}

// Splits on whitespace and/or commas, as SVG number lists allow.
inline std::vector<std::string_view> splitNumberList(std::string_view s) {
    std::vector<std::string_view> out;
    std::size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && (isXmlSpace(s[i]) || s[i] == ',')) i++;
        const std::size_t start = i;
        while (i < s.size() && !isXmlSpace(s[i]) && s[i] != ',') i++;
        if (i > start) out.push_back(s.substr(start, i - start));
    }
    return out;
}

} // namespace svgcore
