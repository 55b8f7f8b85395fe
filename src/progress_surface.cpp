#include "progress_surface.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <utility>

#include "path_label.hpp"
#include "utils.hpp"

namespace {

constexpr std::array<const char*, 10> kSpinnerFrames = {
  "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"
};

std::string pad_right(const std::string& text, std::size_t width) {
  auto used = display_width(text);
  if(used >= width) return text;
  return text + std::string(width - used, ' ');
}

std::string pad_left(const std::string& text, std::size_t width) {
  auto used = display_width(text);
  if(used >= width) return text;
  return std::string(width - used, ' ') + text;
}

double seconds_between(std::chrono::steady_clock::time_point from,
                       std::chrono::steady_clock::time_point to) {
  return std::chrono::duration<double>(to - from).count();
}

} // namespace

TerminalSurface::TerminalSurface(Options options)
  : options_(options),
    started_(Clock::now()),
    last_draw_(started_ - options.min_redraw_interval) {}

TerminalSurface::~TerminalSurface() {
  close();
}

IndicatorHandle TerminalSurface::add_indicator(const std::string& label, uint64_t total_size) {
  const auto handle = next_handle_++;
  Line line;
  line.label = label;
  line.total = total_size;
  line.started = Clock::now();
  lines_.emplace(handle, std::move(line));
  order_.push_back(handle);
  return handle;
}

void TerminalSurface::set_position(IndicatorHandle handle, uint64_t bytes_so_far) {
  auto it = lines_.find(handle);
  if(it == lines_.end()) return;
  it->second.position = std::min(bytes_so_far, it->second.total);
}

void TerminalSurface::finish_indicator(IndicatorHandle handle, bool ok) {
  auto it = lines_.find(handle);
  if(it == lines_.end() || it->second.finished) return;
  it->second.finished = true;
  it->second.ok = ok;
  it->second.ended = Clock::now();
  if(ok) it->second.position = it->second.total;
}

void TerminalSurface::remove_indicator(IndicatorHandle handle) {
  auto it = lines_.find(handle);
  if(it == lines_.end()) return;
  retired_.push_back(render_line(it->second, Clock::now()));
  lines_.erase(it);
  order_.erase(std::remove(order_.begin(), order_.end(), handle), order_.end());
}

void TerminalSurface::set_aggregate(std::size_t completed, std::size_t total, std::size_t failed) {
  has_aggregate_ = true;
  agg_completed_ = completed;
  agg_total_ = total;
  agg_failed_ = failed;
}

void TerminalSurface::finish_aggregate() {
  if(!has_aggregate_) return;
  aggregate_finished_ = true;
}

std::string TerminalSurface::render_bar(uint64_t position, uint64_t total) const {
  const std::size_t width = options_.bar_width;
  const double ratio = total == 0 ? 1.0 : static_cast<double>(position) / static_cast<double>(total);
  const double cells = std::clamp(ratio, 0.0, 1.0) * static_cast<double>(width);
  const auto full = static_cast<std::size_t>(std::floor(cells));
  const double fraction = cells - static_cast<double>(full);

  std::string done_part;
  for(std::size_t i = 0; i < full; ++i) done_part += "█";
  std::string rest_part;
  std::size_t rest = width - full;
  if(rest > 0 && fraction > 0.0) {
    rest_part += fraction >= 0.5 ? "▓" : "▒";
    --rest;
  }
  for(std::size_t i = 0; i < rest; ++i) rest_part += "░";
  return colorize(done_part, Ansi::Cyan, options_.color) + colorize(rest_part, Ansi::Blue, options_.color);
}

std::string TerminalSurface::render_line(const Line& line, Clock::time_point now) const {
  const auto end = line.finished ? line.ended : now;
  const double elapsed = std::max(0.0, seconds_between(line.started, end));
  const double rate = elapsed > 0.0 ? static_cast<double>(line.position) / elapsed : 0.0;

  std::string glyph;
  std::string label = pad_right(line.label, options_.label_width);
  if(line.finished) {
    glyph = line.ok ? colorize("✓", Ansi::Green, options_.color) : colorize("✗", Ansi::Red, options_.color);
  } else {
    glyph = colorize(kSpinnerFrames[frame_ % kSpinnerFrames.size()], Ansi::Green, options_.color);
    label = colorize(label, Ansi::Cyan, options_.color);
  }

  std::string eta = "--:--:--";
  if(line.finished) {
    eta = format_duration(0);
  } else if(rate > 0.0 && line.total >= line.position) {
    eta = format_duration(static_cast<uint64_t>(static_cast<double>(line.total - line.position) / rate));
  }

  return fmt::format("{} {} [{}] {} {}/{} {} {}",
                     glyph,
                     label,
                     format_duration(static_cast<uint64_t>(elapsed)),
                     render_bar(line.position, line.total),
                     pad_left(format_bytes(line.position), 9),
                     pad_right(format_bytes(line.total), 9),
                     pad_left(format_speed(rate) + "/s", 12),
                     eta);
}

std::string TerminalSurface::render_aggregate(Clock::time_point now) const {
  const double elapsed = std::max(0.0, seconds_between(started_, now));
  std::string counts = fmt::format("{}/{} items", agg_completed_, agg_total_);
  if(agg_failed_ > 0) {
    counts += ", " + colorize(fmt::format("{} failed", agg_failed_), Ansi::Red, options_.color);
  }
  const auto glyph = aggregate_finished_
    ? colorize(agg_failed_ > 0 ? "✗" : "✓", agg_failed_ > 0 ? Ansi::Red : Ansi::Green, options_.color)
    : colorize("Σ", Ansi::Bold, options_.color);
  return fmt::format("{} {} [{}] {} {}",
                     glyph,
                     pad_right("total", options_.label_width),
                     format_duration(static_cast<uint64_t>(elapsed)),
                     render_bar(agg_completed_, agg_total_),
                     counts);
}

void TerminalSurface::refresh(bool force) {
  if(closed_) return;
  const auto now = Clock::now();
  if(!force && now - last_draw_ < options_.min_redraw_interval) return;

  std::vector<std::string> block;
  block.reserve(order_.size() + 1);
  for(auto handle : order_) {
    block.push_back(render_line(lines_.at(handle), now));
  }
  if(has_aggregate_) {
    block.push_back(render_aggregate(now));
  }

  std::string frame;
  auto console = lock_console();
  const auto height = live_region_height();
  if(height > 0) {
    frame += fmt::format("\r\x1b[{}A", height);
  }
  frame += "\x1b[J";
  for(const auto& line : retired_) {
    frame += line;
    frame += '\n';
  }
  for(const auto& line : block) {
    frame += line;
    frame += '\n';
  }
  std::fwrite(frame.data(), 1, frame.size(), stderr);
  std::fflush(stderr);
  set_live_region_height(block.size());

  retired_.clear();
  last_draw_ = now;
  ++frame_;
}

void TerminalSurface::close() {
  if(closed_) return;
  refresh(true);
  closed_ = true;
  auto console = lock_console();
  set_live_region_height(0);
}

LogSurface::LogSurface(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

IndicatorHandle LogSurface::add_indicator(const std::string& label, uint64_t total_size) {
  const auto handle = next_handle_++;
  entries_[handle] = Entry{label, total_size, 0};
  log_debug(logger_.get(), "Copying {} ({})", label, format_bytes(total_size));
  return handle;
}

void LogSurface::set_position(IndicatorHandle handle, uint64_t bytes_so_far) {
  auto it = entries_.find(handle);
  if(it != entries_.end()) it->second.position = bytes_so_far;
}

void LogSurface::finish_indicator(IndicatorHandle handle, bool ok) {
  auto it = entries_.find(handle);
  if(it == entries_.end()) return;
  const auto& entry = it->second;
  if(ok) {
    print_out(logger_.get(), "✓ {} ({})", entry.label, format_bytes(entry.total));
  } else {
    print_err(logger_.get(), "✗ {} ({} of {})", entry.label, format_bytes(entry.position), format_bytes(entry.total));
  }
}

void LogSurface::remove_indicator(IndicatorHandle handle) {
  entries_.erase(handle);
}

void LogSurface::set_aggregate(std::size_t completed, std::size_t total, std::size_t failed) {
  has_aggregate_ = true;
  completed_ = completed;
  total_ = total;
  failed_ = failed;
}

void LogSurface::finish_aggregate() {
  if(!has_aggregate_) return;
  if(failed_ > 0) {
    print_err(logger_.get(), "{}/{} items finished, {} failed", completed_, total_, failed_);
  } else {
    print_out(logger_.get(), "{}/{} items finished", completed_, total_);
  }
}
