#include "channel.hpp"
#include "command_line_parser.hpp"
#include "copy_engine.hpp"
#include "display_coordinator.hpp"
#include "path_label.hpp"
#include "progress_surface.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <chrono>
#include <map>
#include <random>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using parcopy::test::RecordingSurface;
using parcopy::test::SurfaceRecord;
using parcopy::test::TempWorkspace;
using parcopy::test::TestCase;
using parcopy::test::TestContext;
using IntChannel = BoundedChannel<int>;

struct Harness {
  std::shared_ptr<SurfaceRecord> record = std::make_shared<SurfaceRecord>();
  DisplayCoordinator coordinator;

  explicit Harness(DisplayCoordinator::Options options)
    : coordinator(options, std::make_unique<RecordingSurface>(record)) {}
};

DisplayCoordinator::Options capped(std::size_t cap, std::size_t total_items = 0) {
  DisplayCoordinator::Options options;
  options.display_cap = cap;
  options.total_items = total_items;
  return options;
}

// Owns argv storage for CommandLineParser::parse.
std::vector<std::string> parse_args(const std::vector<std::string>& args, SettingsManager& settings) {
  std::vector<std::string> storage = {"parcopy"};
  storage.insert(storage.end(), args.begin(), args.end());
  std::vector<char*> argv;
  for(auto& arg : storage) argv.push_back(arg.data());
  CommandLineParser parser;
  return parser.parse(static_cast<int>(argv.size()), argv.data(), settings);
}

bool test_channel_closes_after_last_sender(TestContext&) {
  auto channel = IntChannel::create(4);
  auto second = channel.first;
  channel.first.release();
  if(!second.send(7)) return false;

  int value = 0;
  if(channel.second.receive(value, 10ms) != IntChannel::RecvStatus::Value || value != 7) return false;
  if(channel.second.receive(value, 10ms) != IntChannel::RecvStatus::Timeout) return false;
  second.release();
  return channel.second.receive(value) == IntChannel::RecvStatus::Closed;
}

bool test_channel_drains_after_close(TestContext&) {
  auto channel = IntChannel::create(8);
  for(int i = 0; i < 5; ++i) channel.first.send(i);
  channel.first.release();
  int value = -1;
  for(int i = 0; i < 5; ++i) {
    if(channel.second.receive(value) != IntChannel::RecvStatus::Value || value != i) return false;
  }
  return channel.second.receive(value) == IntChannel::RecvStatus::Closed;
}

bool test_channel_blocks_when_full(TestContext&) {
  auto channel = IntChannel::create(2);
  std::thread producer([sender = std::move(channel.first)]() mutable {
    for(int i = 0; i < 10; ++i) sender.send(i);
  });
  const bool bounded = parcopy::test::wait_for_condition([&]{ return channel.second.pending() == 2; }, 1s) &&
                       channel.second.pending() == 2;

  std::vector<int> received;
  int value = 0;
  while(channel.second.receive(value) == IntChannel::RecvStatus::Value) {
    received.push_back(value);
  }
  producer.join();
  std::vector<int> expected = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
  return bounded && received == expected;
}

bool test_channel_send_fails_once_receiver_closed(TestContext&) {
  auto channel = IntChannel::create(1);
  if(!channel.first.send(1)) return false;
  bool blocked_result = true;
  std::thread producer([&]{ blocked_result = channel.first.send(2); });
  std::this_thread::sleep_for(20ms);
  channel.second.close();
  producer.join();
  return !blocked_result && !channel.first.send(3);
}

bool test_channel_preserves_per_producer_order(TestContext&) {
  using Tagged = std::pair<int, int>;
  auto channel = BoundedChannel<Tagged>::create(8);
  std::vector<std::thread> producers;
  for(int p = 0; p < 4; ++p) {
    producers.emplace_back([p, sender = channel.first]() mutable {
      for(int i = 0; i < 200; ++i) sender.send(Tagged{p, i});
    });
  }
  channel.first.release();

  std::map<int, int> next;
  Tagged value;
  std::size_t count = 0;
  bool ordered = true;
  while(channel.second.receive(value) == BoundedChannel<Tagged>::RecvStatus::Value) {
    if(value.second != next[value.first]) ordered = false;
    next[value.first] = value.second + 1;
    ++count;
  }
  for(auto& t : producers) t.join();
  return ordered && count == 800;
}

bool test_coordinator_evicts_finished_for_new_items(TestContext&) {
  Harness h(capped(3, 4));
  auto& c = h.coordinator;
  c.handle(make_new_item(1, "a", 10));
  c.handle(make_new_item(2, "b", 10));
  c.handle(make_new_item(3, "c", 10));
  c.handle(make_done(1));
  c.handle(make_new_item(4, "d", 10));
  return c.active_count() == 3 &&
         h.record->max_live == 3 &&
         h.record->indicators[1].removed &&
         !h.record->indicators[2].removed &&
         c.stats().evicted == 1;
}

bool test_coordinator_cap_is_soft_without_finished(TestContext&) {
  Harness h(capped(2));
  auto& c = h.coordinator;
  c.handle(make_new_item(1, "a", 10));
  c.handle(make_new_item(2, "b", 10));
  c.handle(make_new_item(3, "c", 10));
  if(c.active_count() != 3 || c.stats().peak_active != 3) return false;
  c.handle(make_done(2));
  c.handle(make_new_item(4, "d", 10));
  // Only the finished one goes; the cap cannot be reached without hiding live work.
  return c.active_count() == 3 && h.record->indicators[2].removed && c.stats().evicted == 1;
}

bool test_coordinator_cap_holds_for_random_interleavings(TestContext&) {
  for(unsigned seed = 1; seed <= 60; ++seed) {
    std::mt19937 rng(seed);
    const std::size_t workers = 1 + rng() % 6;
    const std::size_t cap = 1 + rng() % 5;
    const std::size_t items = 40;

    Harness h(capped(cap, items));
    auto& c = h.coordinator;

    // Each worker walks its items through New, a few Advanced, then Done.
    struct Worker { TrackingId id = 0; int step = 0; int advances = 0; };
    std::vector<Worker> pool(workers);
    TrackingId next_id = 1;
    std::size_t started = 0;
    std::size_t unfinished = 0;
    std::size_t done = 0;

    while(done < items) {
      auto& w = pool[rng() % workers];
      if(w.id == 0) {
        if(started == items) continue;
        w.id = next_id++;
        w.step = 0;
        w.advances = static_cast<int>(rng() % 4);
        ++started;
        ++unfinished;
        c.handle(make_new_item(w.id, "item" + std::to_string(w.id), 100));
        if(c.active_count() > std::max(cap, unfinished)) return false;
      } else if(w.step < w.advances) {
        ++w.step;
        c.handle(make_advanced(w.id, static_cast<uint64_t>(w.step) * 10));
      } else {
        c.handle(make_done(w.id, rng() % 7 != 0));
        w.id = 0;
        --unfinished;
        ++done;
      }
      if(h.record->live != c.active_count()) return false;
    }
    c.finish();
    if(c.stats().completed != items || h.record->aggregate_completed != items) return false;
  }
  return true;
}

bool test_coordinator_ignores_unknown_and_stale_events(TestContext&) {
  Harness h(capped(4));
  auto& c = h.coordinator;
  c.handle(make_advanced(99, 5));
  c.handle(make_new_item(1, "a", 10));
  c.handle(make_new_item(1, "a again", 10));
  c.handle(make_advanced(1, 4));
  c.handle(make_done(1));
  c.handle(make_advanced(1, 8));
  c.handle(make_done(1));
  return c.stats().ignored_events == 4 &&
         c.stats().completed == 1 &&
         c.active_count() == 1 &&
         h.record->indicators[1].position == 4 &&
         h.record->indicators.size() == 1;
}

bool test_coordinator_done_for_untracked_id_not_counted(TestContext&) {
  Harness h(capped(1, 2));
  auto& c = h.coordinator;
  c.handle(make_done(42, false));
  c.handle(make_new_item(1, "a", 10));
  c.handle(make_done(1));
  c.handle(make_new_item(2, "b", 10));
  // 1 was evicted to make room for 2; a repeat of its Done is now unknown.
  c.handle(make_done(1));
  if(!h.record->indicators[1].removed || c.stats().completed != 1) return false;
  c.handle(make_done(2));
  return c.stats().ignored_events == 2 &&
         c.stats().completed == 2 &&
         c.stats().failed == 0 &&
         h.record->aggregate_completed == 2 &&
         h.record->aggregate_total == 2 &&
         h.record->aggregate_failed == 0;
}

bool test_coordinator_counts_failures(TestContext&) {
  Harness h(capped(4, 3));
  auto& c = h.coordinator;
  c.handle(make_new_item(1, "a", 10));
  c.handle(make_new_item(2, "b", 10));
  c.handle(make_new_item(3, "c", 10));
  c.handle(make_done(1));
  c.handle(make_done(2, false));
  c.handle(make_done(3));
  return c.stats().completed == 3 && c.stats().failed == 1 &&
         h.record->aggregate_completed == 3 &&
         h.record->aggregate_total == 3 &&
         h.record->aggregate_failed == 1 &&
         !h.record->indicators[2].ok &&
         h.record->indicators[1].ok;
}

bool test_coordinator_finish_finalizes_everything(TestContext&) {
  Harness h(capped(4, 2));
  auto& c = h.coordinator;
  c.handle(make_new_item(1, "a", 10));
  c.handle(make_advanced(1, 3));
  c.finish();
  c.finish();
  return h.record->indicators[1].finished &&
         h.record->aggregate_finished &&
         h.record->closed &&
         c.active_count() == 0;
}

bool test_coordinator_deferred_eviction(TestContext&) {
  auto options = capped(4);
  options.finished_linger = 50ms;
  Harness h(options);
  auto& c = h.coordinator;
  const auto t0 = DisplayCoordinator::Clock::now();
  c.handle(make_new_item(1, "a", 10), t0);
  c.handle(make_new_item(2, "b", 10), t0);
  c.handle(make_done(1), t0);
  c.tick(t0 + 10ms);
  if(c.active_count() != 2) return false;
  c.tick(t0 + 60ms);
  return c.active_count() == 1 && h.record->indicators[1].removed && !h.record->indicators[2].removed;
}

bool test_coordinator_shortens_labels(TestContext&) {
  auto options = capped(4);
  options.label_width = 16;
  Harness h(options);
  h.coordinator.handle(make_new_item(1, "/var/lib/something/deep/report.csv", 10));
  const auto& label = h.record->indicators[1].label;
  return display_width(label) <= 16 && label.find("report.csv") != std::string::npos;
}

bool test_coordinator_run_until_senders_gone(TestContext&) {
  Harness h(capped(3, 20));
  auto channel = ProgressChannel::create(4);
  std::vector<std::thread> producers;
  for(int p = 0; p < 4; ++p) {
    producers.emplace_back([sender = channel.first]() mutable {
      for(int i = 0; i < 5; ++i) {
        const auto id = next_tracking_id();
        sender.send(make_new_item(id, "file" + std::to_string(id), 2));
        sender.send(make_advanced(id, 1));
        sender.send(make_advanced(id, 2));
        sender.send(make_done(id));
      }
    });
  }
  channel.first.release();
  h.coordinator.run(channel.second);
  for(auto& t : producers) t.join();
  return h.coordinator.stats().completed == 20 &&
         h.record->closed &&
         h.record->aggregate_finished &&
         h.record->max_live <= 4;
}

bool test_log_surface_reports_outcomes(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("surface");
  ctx.logs.attach(logger);
  LogSurface surface(logger);
  auto good = surface.add_indicator("good.txt", 2048);
  auto bad = surface.add_indicator("bad.txt", 4096);
  surface.set_position(bad, 1024);
  surface.finish_indicator(good, true);
  surface.finish_indicator(bad, false);
  surface.set_aggregate(2, 2, 1);
  surface.finish_aggregate();
  return ctx.logs.contains("✓ good.txt (2.0 KB)") &&
         ctx.logs.contains("✗ bad.txt (1.0 KB of 4.0 KB)") &&
         ctx.logs.contains("2/2 items finished, 1 failed");
}

bool test_terminal_surface_tracks_live_region(TestContext&) {
  TerminalSurface::Options options;
  options.color = false;
  TerminalSurface surface(options);
  auto a = surface.add_indicator("a", 10);
  surface.add_indicator("b", 10);
  surface.set_aggregate(0, 2, 0);
  surface.refresh(true);
  const bool drawn = live_region_height() == 3;
  surface.finish_indicator(a, true);
  surface.remove_indicator(a);
  surface.refresh(true);
  const bool shrunk = live_region_height() == 2;
  surface.close();
  return drawn && shrunk && live_region_height() == 0;
}

bool test_shorten_path(TestContext&) {
  const std::string fits = "/home/user/file.txt";
  if(shorten_path(fits, 40) != fits) return false;
  if(shorten_path("/very/long/directory/name/file.txt", 20) != "/very/long…/file.txt") return false;
  if(shorten_path("abcdef", 0) != "") return false;
  if(shorten_path("abcdef", 1) != "…") return false;

  const auto long_name = "a/" + std::string(30, 'x') + "END";
  const auto both_ends = shorten_path(long_name, 10);
  if(display_width(both_ends) != 10) return false;
  if(both_ends.rfind("a/", 0) != 0 || both_ends.find("END") == std::string::npos) return false;

  const std::string wide = "ñandú/ñandú/ñandú/ñandú.txt";
  const auto shortened = shorten_path(wide, 14);
  return display_width(wide) == 27 && display_width(shortened) == 14 &&
         shortened.find("/ñandú.txt") != std::string::npos;
}

bool test_format_speed(TestContext&) {
  return format_speed(0) == "0.0 B" &&
         format_speed(1023) == "1023.0 B" &&
         format_speed(1024) == "1.0 KB" &&
         format_speed(1536) == "1.5 KB" &&
         format_speed(3.0 * 1024 * 1024) == "3.0 MB" &&
         format_speed(1024.0 * 1024 * 1024 * 1024 * 1024) == "1.0 PB" &&
         format_speed(1024.0 * 1024 * 1024 * 1024 * 1024 * 1024) == "1024.0 PB" &&
         format_bytes(2048) == "2.0 KB" &&
         format_duration(3661) == "01:01:01" &&
         format_duration(0) == "00:00:00";
}

bool test_settings_defaults(TestContext&) {
  SettingsManager settings;
  auto config = CopyEngine::config_from_settings(settings);
  return config.workers == 0 &&
         config.display_cap == 8 &&
         config.buffer_size == 64 * 1024 &&
         config.symlinks == SymlinkPolicy::Recreate &&
         config.refresh_interval == 100ms &&
         config.finished_linger == 0ms &&
         !config.strict &&
         settings.get<bool>("progress");
}

bool test_settings_reject_out_of_range(TestContext&) {
  auto rejects = [](const std::string& key, const nlohmann::json& value) {
    SettingsManager settings;
    std::string error;
    if(!settings.set_from_json(key, value, error)) return true;
    try {
      CopyEngine::config_from_settings(settings);
    } catch(const CopyError& e) {
      return e.kind() == CopyError::Kind::Usage;
    }
    return false;
  };
  return rejects("display_cap", 0) &&
         rejects("buffer_size", 0) &&
         rejects("jobs", -1) &&
         rejects("symlinks", "sometimes") &&
         rejects("progress", "maybe");
}

bool test_cli_parses_options_and_paths(TestContext&) {
  SettingsManager settings;
  auto paths = parse_args({"--jobs", "3", "-cap", "5", "-p", "false", "--strict",
                           "--symlinks", "skip", "a", "b", "--", "--odd-name", "dest"}, settings);
  const std::vector<std::string> expected = {"a", "b", "--odd-name", "dest"};
  return paths == expected &&
         settings.get<long long>("jobs") == 3 &&
         settings.get<long long>("display_cap") == 5 &&
         !settings.get<bool>("progress") &&
         settings.get<bool>("strict") &&
         settings.get<std::string>("symlinks") == "skip";
}

bool test_cli_rejects_bad_input(TestContext&) {
  auto throws = [](const std::vector<std::string>& args) {
    SettingsManager settings;
    try {
      parse_args(args, settings);
    } catch(const UsageError&) {
      return true;
    }
    return false;
  };
  return throws({"--no-such-option", "a", "b"}) &&
         throws({"a", "b", "--jobs"}) &&
         throws({"--jobs", "many", "a", "b"}) &&
         throws({"--config", "/nonexistent/parcopy.json", "a", "b"});
}

bool test_cli_config_file_merges_under_flags(TestContext&) {
  TempWorkspace ws("cli_config");
  parcopy::test::write_file(ws / "parcopy.json",
                            R"({"jobs": 6, "display_cap": 3, "symlinks": "follow", "colour": true})");
  SettingsManager settings;
  auto paths = parse_args({"--cap", "7", "--config", (ws / "parcopy.json").string(), "src", "dst"}, settings);
  return paths.size() == 2 &&
         settings.get<long long>("jobs") == 6 &&
         settings.get<long long>("display_cap") == 7 &&
         settings.get<std::string>("symlinks") == "follow";
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"channel_closes_after_last_sender", test_channel_closes_after_last_sender},
    {"channel_drains_after_close", test_channel_drains_after_close},
    {"channel_blocks_when_full", test_channel_blocks_when_full},
    {"channel_send_fails_once_receiver_closed", test_channel_send_fails_once_receiver_closed},
    {"channel_preserves_per_producer_order", test_channel_preserves_per_producer_order},
    {"coordinator_evicts_finished_for_new_items", test_coordinator_evicts_finished_for_new_items},
    {"coordinator_cap_is_soft_without_finished", test_coordinator_cap_is_soft_without_finished},
    {"coordinator_cap_holds_for_random_interleavings", test_coordinator_cap_holds_for_random_interleavings},
    {"coordinator_ignores_unknown_and_stale_events", test_coordinator_ignores_unknown_and_stale_events},
    {"coordinator_done_for_untracked_id_not_counted", test_coordinator_done_for_untracked_id_not_counted},
    {"coordinator_counts_failures", test_coordinator_counts_failures},
    {"coordinator_finish_finalizes_everything", test_coordinator_finish_finalizes_everything},
    {"coordinator_deferred_eviction", test_coordinator_deferred_eviction},
    {"coordinator_shortens_labels", test_coordinator_shortens_labels},
    {"coordinator_run_until_senders_gone", test_coordinator_run_until_senders_gone},
    {"log_surface_reports_outcomes", test_log_surface_reports_outcomes},
    {"terminal_surface_tracks_live_region", test_terminal_surface_tracks_live_region},
    {"shorten_path", test_shorten_path},
    {"format_speed", test_format_speed},
    {"settings_defaults", test_settings_defaults},
    {"settings_reject_out_of_range", test_settings_reject_out_of_range},
    {"cli_parses_options_and_paths", test_cli_parses_options_and_paths},
    {"cli_rejects_bad_input", test_cli_rejects_bad_input},
    {"cli_config_file_merges_under_flags", test_cli_config_file_merges_under_flags},
  };
  return parcopy::test::run_tests("display", tests, argc, argv);
}
