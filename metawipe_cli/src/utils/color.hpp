#ifndef METAWIPE_COLOR_HPP
#define METAWIPE_COLOR_HPP

#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

/**
 * @brief ANSI escape sequences, or empty strings when colour is off.
 *
 * Colour is off when NO_COLOR is set or stdout is not a terminal.
 */
struct Palette {
    const char* red = "";
    const char* green = "";
    const char* yellow = "";
    const char* cyan = "";
    const char* bold = "";
    const char* reset = "";

    static Palette detect() {
        const char* no_color = std::getenv("NO_COLOR");
        if ((no_color && *no_color) || isatty(fileno(stdout)) == 0) {
            return {};
        }
        return {"\033[91m", "\033[92m", "\033[93m", "\033[96m", "\033[1m", "\033[0m"};
    }
};

#endif // METAWIPE_COLOR_HPP
