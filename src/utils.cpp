#include "utils.hpp"

#include <spdlog/fmt/fmt.h>

#include <array>
#include <unistd.h>

std::string format_speed(double bytes_per_sec) {
    static constexpr std::array<const char*, 6> kUnits = {"B", "KB", "MB", "GB", "TB", "PB"};
    double size = bytes_per_sec < 0.0 ? 0.0 : bytes_per_sec;
    std::size_t unit = 0;
    while(size >= 1024.0 && unit < kUnits.size() - 1) {
        size /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", size, kUnits[unit]);
}

std::string format_bytes(uint64_t bytes) {
    return format_speed(static_cast<double>(bytes));
}

std::string format_duration(uint64_t seconds) {
    return fmt::format("{:02}:{:02}:{:02}", seconds / 3600, (seconds / 60) % 60, seconds % 60);
}

std::string colorize(const std::string& text, Ansi style, bool enabled) {
    if(!enabled) return text;
    const char* code = "0";
    switch(style) {
        case Ansi::Cyan:   code = "36"; break;
        case Ansi::Green:  code = "32"; break;
        case Ansi::Red:    code = "31"; break;
        case Ansi::Blue:   code = "34"; break;
        case Ansi::Yellow: code = "33"; break;
        case Ansi::Dim:    code = "2";  break;
        case Ansi::Bold:   code = "1";  break;
    }
    return fmt::format("\x1b[{}m{}\x1b[0m", code, text);
}

bool stderr_is_terminal() {
    return ::isatty(STDERR_FILENO) == 1;
}
