/**
 * @file json.hpp
 * @brief Minimal helpers for hand-assembled NDJSON lines.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cmath>
#include <cstdio>
#include <string>
#include <string_view>

namespace tree_scheduler {

/// Escape a string for embedding between JSON double quotes.
[[nodiscard]] inline std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

/// Round half away from zero to two decimals.
[[nodiscard]] inline double round2(double value) noexcept {
    return std::round(value * 100.0) / 100.0;
}

}  // namespace tree_scheduler
