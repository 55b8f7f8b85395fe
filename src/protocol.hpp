#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <variant>

#include "copy_types.hpp"

// Progress protocol between copy workers and the display coordinator.
// Per id: exactly one NewItem, then zero or more Advanced with non-decreasing
// bytes_so_far, then exactly one Done.

struct NewItemEvent {
  TrackingId id = 0;
  std::string display_path;
  uint64_t total_size = 0;
};

struct AdvancedEvent {
  TrackingId id = 0;
  uint64_t bytes_so_far = 0;
};

struct DoneEvent {
  TrackingId id = 0;
  bool ok = true;
};

using ProgressEvent = std::variant<NewItemEvent, AdvancedEvent, DoneEvent>;

using ProgressReporter = std::function<void(ProgressEvent)>;

// Symlinks are shown with this synthetic size so they render like files.
inline constexpr uint64_t kSymlinkSyntheticSize = 1;

ProgressEvent make_new_item(TrackingId id, std::string display_path, uint64_t total_size);
ProgressEvent make_advanced(TrackingId id, uint64_t bytes_so_far);
ProgressEvent make_done(TrackingId id, bool ok = true);

TrackingId event_id(const ProgressEvent& event);
std::string describe_event(const ProgressEvent& event);
