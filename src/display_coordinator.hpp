#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "channel.hpp"
#include "log.hpp"
#include "progress_surface.hpp"
#include "protocol.hpp"

using ProgressChannel = BoundedChannel<ProgressEvent>;

// Single consumer of the progress channel. Owns every indicator and the
// aggregate; nothing else touches them, so none of this state is locked.
//
// The display cap is a soft budget: a new item evicts the oldest finished
// indicators until it fits, and is shown anyway when none has finished yet.
class DisplayCoordinator {
public:
  using Clock = std::chrono::steady_clock;

  struct Options {
    std::size_t display_cap = 8;
    std::size_t label_width = 30;
    // Receive timeout; each expiry runs maintenance and redraws.
    std::chrono::milliseconds tick{100};
    // When non-zero, finished indicators are evicted this long after Done
    // even if no new item needs the slot.
    std::chrono::milliseconds finished_linger{0};
    bool show_aggregate = true;
    std::size_t total_items = 0;
  };

  struct Stats {
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t peak_active = 0;
    std::size_t evicted = 0;
    std::size_t ignored_events = 0;
  };

  DisplayCoordinator(Options options,
                     std::unique_ptr<ProgressSurface> surface,
                     std::shared_ptr<Logger> logger = nullptr);

  // Consumes events until every sender is gone and the queue is drained, then
  // finalizes the display.
  void run(ProgressChannel::Receiver& events);

  void handle(const ProgressEvent& event, Clock::time_point now = Clock::now());
  // Periodic maintenance: deferred eviction and a throttled redraw.
  void tick(Clock::time_point now = Clock::now());
  // Renders every remaining indicator and the aggregate as finished and
  // releases them.
  void finish();

  std::size_t active_count() const { return active_.size(); }
  const Stats& stats() const { return stats_; }

private:
  struct ActiveIndicator {
    TrackingId id = 0;
    std::string display_path;
    bool finished = false;
    bool ok = true;
    IndicatorHandle handle = 0;
  };

  struct PendingEviction {
    TrackingId id = 0;
    Clock::time_point due;
  };

  void on_new_item(const NewItemEvent& event);
  void on_advanced(const AdvancedEvent& event);
  void on_done(const DoneEvent& event, Clock::time_point now);

  ActiveIndicator* find(TrackingId id);
  void make_room();
  void evict(std::vector<ActiveIndicator>::iterator it);
  void ignore(const ProgressEvent& event);
  void update_aggregate();

  Options options_;
  std::unique_ptr<ProgressSurface> surface_;
  std::shared_ptr<Logger> logger_;
  std::vector<ActiveIndicator> active_;
  std::deque<PendingEviction> eviction_queue_;
  Stats stats_;
  bool finished_ = false;
};
