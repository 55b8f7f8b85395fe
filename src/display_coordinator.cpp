#include "display_coordinator.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>
#include <variant>

#include "path_label.hpp"

DisplayCoordinator::DisplayCoordinator(Options options,
                                       std::unique_ptr<ProgressSurface> surface,
                                       std::shared_ptr<Logger> logger)
  : options_(options),
    surface_(std::move(surface)),
    logger_(std::move(logger)) {
  if(options_.display_cap == 0) options_.display_cap = 1;
  if(options_.tick.count() <= 0) options_.tick = std::chrono::milliseconds(100);
  if(options_.show_aggregate) update_aggregate();
}

void DisplayCoordinator::run(ProgressChannel::Receiver& events) {
  ProgressEvent event;
  while(true) {
    auto status = events.receive(event, options_.tick);
    if(status == ProgressChannel::RecvStatus::Closed) break;
    const auto now = Clock::now();
    if(status == ProgressChannel::RecvStatus::Value) {
      handle(event, now);
    }
    tick(now);
  }
  finish();
}

void DisplayCoordinator::handle(const ProgressEvent& event, Clock::time_point now) {
  std::visit([&](const auto& e){
    using T = std::decay_t<decltype(e)>;
    if constexpr(std::is_same_v<T, NewItemEvent>) {
      on_new_item(e);
    } else if constexpr(std::is_same_v<T, AdvancedEvent>) {
      on_advanced(e);
    } else {
      on_done(e, now);
    }
  }, event);
}

void DisplayCoordinator::tick(Clock::time_point now) {
  while(!eviction_queue_.empty() && eviction_queue_.front().due <= now) {
    auto id = eviction_queue_.front().id;
    eviction_queue_.pop_front();
    auto it = std::find_if(active_.begin(), active_.end(),
                           [id](const ActiveIndicator& a){ return a.id == id; });
    if(it != active_.end() && it->finished) {
      evict(it);
    }
  }
  if(surface_) surface_->refresh(false);
}

void DisplayCoordinator::finish() {
  if(finished_) return;
  finished_ = true;
  for(auto& indicator : active_) {
    if(!indicator.finished) {
      indicator.finished = true;
      if(surface_) surface_->finish_indicator(indicator.handle, indicator.ok);
    }
  }
  if(options_.show_aggregate && surface_) {
    update_aggregate();
    surface_->finish_aggregate();
  }
  if(surface_) surface_->close();
  active_.clear();
  eviction_queue_.clear();
  log_debug(logger_.get(), "Display finished: {} completed, {} failed, peak {} indicators, {} evicted",
            stats_.completed, stats_.failed, stats_.peak_active, stats_.evicted);
}

void DisplayCoordinator::on_new_item(const NewItemEvent& event) {
  if(find(event.id)) {
    ignore(event);
    return;
  }
  make_room();
  ActiveIndicator indicator;
  indicator.id = event.id;
  indicator.display_path = event.display_path;
  if(surface_) {
    indicator.handle = surface_->add_indicator(shorten_path(event.display_path, options_.label_width),
                                               event.total_size);
  }
  active_.push_back(std::move(indicator));
  stats_.peak_active = std::max(stats_.peak_active, active_.size());
}

void DisplayCoordinator::on_advanced(const AdvancedEvent& event) {
  auto* indicator = find(event.id);
  if(!indicator || indicator->finished) {
    ignore(event);
    return;
  }
  if(surface_) surface_->set_position(indicator->handle, event.bytes_so_far);
}

void DisplayCoordinator::on_done(const DoneEvent& event, Clock::time_point now) {
  auto* indicator = find(event.id);
  // Unknown ids and repeats for evicted items must not move the aggregate.
  if(!indicator || indicator->finished) {
    ignore(event);
    return;
  }
  indicator->finished = true;
  indicator->ok = event.ok;
  if(surface_) surface_->finish_indicator(indicator->handle, event.ok);
  if(options_.finished_linger.count() > 0) {
    eviction_queue_.push_back(PendingEviction{event.id, now + options_.finished_linger});
  }
  ++stats_.completed;
  if(!event.ok) ++stats_.failed;
  if(options_.show_aggregate) update_aggregate();
}

DisplayCoordinator::ActiveIndicator* DisplayCoordinator::find(TrackingId id) {
  auto it = std::find_if(active_.begin(), active_.end(),
                         [id](const ActiveIndicator& a){ return a.id == id; });
  return it == active_.end() ? nullptr : &*it;
}

void DisplayCoordinator::make_room() {
  while(active_.size() >= options_.display_cap) {
    auto it = std::find_if(active_.begin(), active_.end(),
                           [](const ActiveIndicator& a){ return a.finished; });
    if(it == active_.end()) return;
    evict(it);
  }
}

void DisplayCoordinator::evict(std::vector<ActiveIndicator>::iterator it) {
  if(surface_) surface_->remove_indicator(it->handle);
  active_.erase(it);
  ++stats_.evicted;
}

void DisplayCoordinator::ignore(const ProgressEvent& event) {
  ++stats_.ignored_events;
  log_debug(logger_.get(), "Ignoring out-of-order event: {}", describe_event(event));
}

void DisplayCoordinator::update_aggregate() {
  if(!surface_) return;
  surface_->set_aggregate(stats_.completed, options_.total_items, stats_.failed);
}
