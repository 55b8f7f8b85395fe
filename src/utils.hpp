#pragma once
#include <cstdint>
#include <string>

// Scales by 1024 through B, KB, MB, GB, TB, PB with one decimal place.
std::string format_speed(double bytes_per_sec);
std::string format_bytes(uint64_t bytes);
// HH:MM:SS, hours grow past two digits if needed.
std::string format_duration(uint64_t seconds);

enum class Ansi { Cyan, Green, Red, Blue, Yellow, Dim, Bold };

std::string colorize(const std::string& text, Ansi style, bool enabled = true);
bool stderr_is_terminal();
