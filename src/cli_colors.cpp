#include "archivedir/cli_colors.hpp"

#include "archivedir/env.hpp"

#include <cstdio>
#include <iostream>
#include <mutex>

#include <unistd.h>

namespace archivedir::cli {

namespace {
    std::once_flag g_colors_once;
    bool g_colors_forced = false;
    bool g_colors_enabled = true;
}

bool IsTerminal(std::ostream& os) {
    if (&os == &std::cout) {
        return isatty(fileno(stdout)) != 0;
    }
    if (&os == &std::cerr || &os == &std::clog) {
        return isatty(fileno(stderr)) != 0;
    }
    return false;
}

bool ColorsEnabled(std::ostream& os) {
    std::call_once(g_colors_once, [] {
        if (archivedir::env::IsEnabled("ARCHIVEDIR_NO_COLOR") || !archivedir::env::Get("NO_COLOR").empty()) {
            g_colors_forced = true;
            g_colors_enabled = false;
        }
    });
    if (g_colors_forced) {
        return g_colors_enabled;
    }
    // Auto-detect per stream: only color a TTY
    return IsTerminal(os);
}

void SetColorsEnabled(bool enabled) {
    std::call_once(g_colors_once, [] {});
    g_colors_forced = true;
    g_colors_enabled = enabled;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace archivedir::cli
