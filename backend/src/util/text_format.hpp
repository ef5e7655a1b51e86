#pragma once
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <string>
#include <string_view>

// Prometheus label name: [a-zA-Z_][a-zA-Z0-9_]*, with the "__" prefix
// reserved for internal use.
inline bool valid_label_name(std::string_view s) {
    if (s.empty() || s.starts_with("__")) return false;
    auto alpha = [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_'; };
    if (!alpha(s.front())) return false;
    for (char c : s.substr(1)) {
        if (!alpha(c) && !(c >= '0' && c <= '9')) return false;
    }
    return true;
}

// Label-value escaper for the Prometheus text format
inline std::string label_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            default:   out += c;      break;
        }
    }
    return out;
}

// Integral values print without a fraction ("42"), everything else with
// 15 significant digits.
inline void write_number(std::ostream& os, double v) {
    if (std::isnan(v)) { os << "NaN"; return; }
    if (std::isinf(v)) { os << (v > 0 ? "+Inf" : "-Inf"); return; }
    if (std::floor(v) == v && std::fabs(v) < 1e15) {
        os << static_cast<std::int64_t>(v);
        return;
    }
    os << std::setprecision(15) << v;
}
