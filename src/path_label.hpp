#pragma once
#include <cstddef>
#include <string>

inline constexpr const char* kEllipsis = "…";

// Shortens a path for display to at most max_width code points. The final
// component is kept whole when it fits, with the head of the directory part
// before a single ellipsis. When the final component alone is too wide, both
// ends of the path are kept and the middle is elided. Pure.
std::string shorten_path(const std::string& path, std::size_t max_width);

// Number of UTF-8 code points in text.
std::size_t display_width(const std::string& text);
