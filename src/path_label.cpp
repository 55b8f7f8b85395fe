#include "path_label.hpp"

#include <vector>

namespace {

bool is_continuation(unsigned char ch) {
  return (ch & 0xC0) == 0x80;
}

// Byte offsets of each code point start, plus the total size as a sentinel.
std::vector<std::size_t> code_point_offsets(const std::string& text) {
  std::vector<std::size_t> offsets;
  offsets.reserve(text.size() + 1);
  for(std::size_t i = 0; i < text.size(); ++i) {
    if(!is_continuation(static_cast<unsigned char>(text[i]))) {
      offsets.push_back(i);
    }
  }
  offsets.push_back(text.size());
  return offsets;
}

} // namespace

std::size_t display_width(const std::string& text) {
  return code_point_offsets(text).size() - 1;
}

std::string shorten_path(const std::string& path, std::size_t max_width) {
  const auto offsets = code_point_offsets(path);
  const std::size_t width = offsets.size() - 1;
  if(width <= max_width) return path;
  if(max_width == 0) return std::string();
  if(max_width == 1) return kEllipsis;

  auto head = [&](std::size_t count) {
    return path.substr(0, offsets[count]);
  };
  auto tail = [&](std::size_t count) {
    return path.substr(offsets[width - count]);
  };

  auto slash = path.find_last_of('/');
  if(slash != std::string::npos && slash + 1 < path.size()) {
    const std::size_t tail_width = display_width(path.substr(slash));
    if(tail_width + 2 <= max_width) {
      return head(max_width - 1 - tail_width) + kEllipsis + path.substr(slash);
    }
  }

  const std::size_t budget = max_width - 1;
  const std::size_t keep_head = budget / 2;
  return head(keep_head) + kEllipsis + tail(budget - keep_head);
}
