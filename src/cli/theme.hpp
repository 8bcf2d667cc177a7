#pragma once

#include <string>
#include <algorithm>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// ResMesh palette (ANSI 24-bit)
// Indigo: #6366F1
// Amber:  #D97706
namespace color {
    const std::string INDIGO    = "\033[38;2;99;102;241m";
    const std::string AMBER     = "\033[38;2;217;119;6m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string indigo(const std::string& s)  { return color::INDIGO + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule(int width = 48) {
    std::string line;
    for (int i = 0; i < width; i++) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

inline std::string banner() {
    return
        "\n"
        + color::INDIGO + color::BOLD
        + "  ResMesh\n"
        + color::RESET + color::DIM + "  asset matching & analytics  v" + RESMESH_VERSION
        + color::RESET + "\n\n"
        + rule();
}

// Section header: blank line before the title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::AMBER + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::INDIGO + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::AMBER + "    > " + color::RESET + msg + "\n";
}

// Key-value row for status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<14}", key) + color::RESET + value + "\n";
}

// Fixed-width bar for a [0,1] score, e.g. "██████░░░░"
inline std::string meter(double fraction, int width = 10) {
    fraction = std::max(0.0, std::min(1.0, fraction));
    int filled = static_cast<int>(fraction * width + 0.5);
    std::string bar;
    for (int i = 0; i < width; i++) bar += i < filled ? "\xe2\x96\x88" : "\xe2\x96\x91";
    return bar;
}

} // namespace theme
