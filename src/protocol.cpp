#include "protocol.hpp"

#include <spdlog/fmt/fmt.h>

#include <utility>

ProgressEvent make_new_item(TrackingId id, std::string display_path, uint64_t total_size) {
    return NewItemEvent{id, std::move(display_path), total_size};
}

ProgressEvent make_advanced(TrackingId id, uint64_t bytes_so_far) {
    return AdvancedEvent{id, bytes_so_far};
}

ProgressEvent make_done(TrackingId id, bool ok) {
    return DoneEvent{id, ok};
}

TrackingId event_id(const ProgressEvent& event) {
    return std::visit([](const auto& e) { return e.id; }, event);
}

std::string describe_event(const ProgressEvent& event) {
    if(auto* e = std::get_if<NewItemEvent>(&event)) {
        return fmt::format("new #{} {} ({} bytes)", e->id, e->display_path, e->total_size);
    }
    if(auto* e = std::get_if<AdvancedEvent>(&event)) {
        return fmt::format("advanced #{} {}", e->id, e->bytes_so_far);
    }
    const auto& done = std::get<DoneEvent>(event);
    return fmt::format("done #{}{}", done.id, done.ok ? "" : " (failed)");
}
