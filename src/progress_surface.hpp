#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "log.hpp"

using IndicatorHandle = std::size_t;

// Where the display coordinator renders. Only the coordinator thread calls
// into a surface, so implementations keep no locks of their own on indicator
// state.
class ProgressSurface {
public:
  virtual ~ProgressSurface() = default;

  virtual IndicatorHandle add_indicator(const std::string& label, uint64_t total_size) = 0;
  virtual void set_position(IndicatorHandle handle, uint64_t bytes_so_far) = 0;
  virtual void finish_indicator(IndicatorHandle handle, bool ok) = 0;
  virtual void remove_indicator(IndicatorHandle handle) = 0;

  virtual void set_aggregate(std::size_t completed, std::size_t total, std::size_t failed) = 0;
  virtual void finish_aggregate() = 0;

  // Draws pending changes. Implementations may throttle unless force is set.
  virtual void refresh(bool force) = 0;
  // Final draw; what is on screen stays as permanent output.
  virtual void close() = 0;
};

// Live multi-line progress block on stderr, redrawn in place with ANSI
// escapes. Removed indicators are printed once above the block as permanent
// history lines.
class TerminalSurface : public ProgressSurface {
public:
  struct Options {
    std::size_t label_width = 30;
    std::size_t bar_width = 40;
    bool color = true;
    std::chrono::milliseconds min_redraw_interval{100};
  };

  explicit TerminalSurface(Options options);
  ~TerminalSurface() override;

  IndicatorHandle add_indicator(const std::string& label, uint64_t total_size) override;
  void set_position(IndicatorHandle handle, uint64_t bytes_so_far) override;
  void finish_indicator(IndicatorHandle handle, bool ok) override;
  void remove_indicator(IndicatorHandle handle) override;
  void set_aggregate(std::size_t completed, std::size_t total, std::size_t failed) override;
  void finish_aggregate() override;
  void refresh(bool force) override;
  void close() override;

private:
  using Clock = std::chrono::steady_clock;

  struct Line {
    std::string label;
    uint64_t total = 0;
    uint64_t position = 0;
    Clock::time_point started;
    Clock::time_point ended;
    bool finished = false;
    bool ok = true;
  };

  std::string render_line(const Line& line, Clock::time_point now) const;
  std::string render_aggregate(Clock::time_point now) const;
  std::string render_bar(uint64_t position, uint64_t total) const;

  Options options_;
  Clock::time_point started_;
  Clock::time_point last_draw_;
  IndicatorHandle next_handle_ = 1;
  std::vector<IndicatorHandle> order_;
  std::unordered_map<IndicatorHandle, Line> lines_;
  std::vector<std::string> retired_;
  bool has_aggregate_ = false;
  bool aggregate_finished_ = false;
  std::size_t agg_completed_ = 0;
  std::size_t agg_total_ = 0;
  std::size_t agg_failed_ = 0;
  std::size_t frame_ = 0;
  bool closed_ = false;
};

// Non-interactive rendering: one log line per finished item and a summary,
// used when stderr is not a terminal or live progress is turned off.
class LogSurface : public ProgressSurface {
public:
  explicit LogSurface(std::shared_ptr<Logger> logger);

  IndicatorHandle add_indicator(const std::string& label, uint64_t total_size) override;
  void set_position(IndicatorHandle handle, uint64_t bytes_so_far) override;
  void finish_indicator(IndicatorHandle handle, bool ok) override;
  void remove_indicator(IndicatorHandle handle) override;
  void set_aggregate(std::size_t completed, std::size_t total, std::size_t failed) override;
  void finish_aggregate() override;
  void refresh(bool) override {}
  void close() override {}

private:
  struct Entry {
    std::string label;
    uint64_t total = 0;
    uint64_t position = 0;
  };

  std::shared_ptr<Logger> logger_;
  IndicatorHandle next_handle_ = 1;
  std::unordered_map<IndicatorHandle, Entry> entries_;
  std::size_t completed_ = 0;
  std::size_t total_ = 0;
  std::size_t failed_ = 0;
  bool has_aggregate_ = false;
};
