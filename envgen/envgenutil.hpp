#pragma once

#include <string>

// ANSI colour helpers for diagnostics.
//
//'\e[1;31m' # Red
//'\e[1;32m' # Green
//'\e[1;33m' # Yellow
//'\e[1;36m' # Cyan

enum class stringColor {red, green, yellow, cyan};

// Cleared by --no-color.
inline bool& color_printing() {
    static bool enabled = true;
    return enabled;
}

inline std::string colorize(std::string const& s, stringColor c) {
    if (!color_printing()) return s;

    switch(c) {
        case stringColor::red   :
            return "\033[1;31m" + s + "\033[0m";
        case stringColor::green :
            return "\033[1;32m" + s + "\033[0m";
        case stringColor::yellow:
            return "\033[1;33m" + s + "\033[0m";
        case stringColor::cyan  :
            return "\033[1;36m" + s + "\033[0m";
    }
    return s;
}

// helpers for inline printing
inline std::string red(std::string const& s) {
    return colorize(s, stringColor::red);
}
inline std::string green(std::string const& s) {
    return colorize(s, stringColor::green);
}
inline std::string yellow(std::string const& s) {
    return colorize(s, stringColor::yellow);
}
inline std::string cyan(std::string const& s) {
    return colorize(s, stringColor::cyan);
}
