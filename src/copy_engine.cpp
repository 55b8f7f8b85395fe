#include "copy_engine.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>

#include "copy_scheduler.hpp"
#include "settings_manager.hpp"
#include "tree_enumerator.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

long long bounded_int(const SettingsManager& settings,
                      const std::string& key,
                      long long min_value,
                      long long max_value) {
  const auto value = settings.get<long long>(key);
  if(value < min_value || value > max_value) {
    throw CopyError(CopyError::Kind::Usage,
                    fmt::format("{} must be between {} and {} (got {})", key, min_value, max_value, value));
  }
  return value;
}

} // namespace

CopyEngine::CopyEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>(options_.name)) {}

CopyEngine::Config CopyEngine::config_from_settings(const SettingsManager& settings) {
  Config config;
  config.workers = static_cast<std::size_t>(bounded_int(settings, "jobs", 0, 1024));
  config.display_cap = static_cast<std::size_t>(bounded_int(settings, "display_cap", 1, 256));
  config.buffer_size = static_cast<std::size_t>(bounded_int(settings, "buffer_size", 1, 256LL * 1024 * 1024));
  config.label_width = static_cast<std::size_t>(bounded_int(settings, "label_width", 8, 1024));
  config.refresh_interval = std::chrono::milliseconds(bounded_int(settings, "refresh_interval_ms", 10, 60000));
  config.finished_linger = std::chrono::milliseconds(bounded_int(settings, "finished_linger_ms", 0, 3600000));
  config.channel_capacity = static_cast<std::size_t>(bounded_int(settings, "channel_capacity", 1, 1 << 20));
  config.progress = settings.get<bool>("progress");
  config.preserve_permissions = settings.get<bool>("preserve_permissions");
  config.strict = settings.get<bool>("strict");
  config.color = settings.get<bool>("color");

  const auto policy = settings.get<std::string>("symlinks");
  if(!parse_symlink_policy(SettingsManager::to_lower(policy), config.symlinks)) {
    throw CopyError(CopyError::Kind::Usage,
                    "symlinks must be one of recreate, follow, skip (got '" + policy + "')");
  }
  return config;
}

std::unique_ptr<ProgressSurface> CopyEngine::make_surface(const Config& config) const {
  if(options_.surface_factory) {
    return options_.surface_factory(config);
  }
  if(config.progress && stderr_is_terminal()) {
    TerminalSurface::Options terminal;
    terminal.label_width = config.label_width;
    terminal.color = config.color;
    terminal.min_redraw_interval = config.refresh_interval;
    return std::make_unique<TerminalSurface>(terminal);
  }
  return std::make_unique<LogSurface>(logger_);
}

bool CopyEngine::shows_aggregate(const std::vector<fs::path>& sources, SymlinkPolicy policy) const {
  if(sources.size() != 1) return true;
  std::error_code ec;
  const auto status = policy == SymlinkPolicy::Follow
    ? fs::status(sources.front(), ec)
    : fs::symlink_status(sources.front(), ec);
  return fs::is_directory(status);
}

RunSummary CopyEngine::run(const std::vector<fs::path>& sources, const fs::path& destination) {
  const auto config = config_from_settings(*settings_);
  logger_->debug("Settings: {}", settings_->get_json().dump());
  const auto started = std::chrono::steady_clock::now();

  TreeEnumerator enumerator(TreeEnumerator::Options{config.symlinks}, logger_);
  auto items = enumerator.plan(sources, destination);
  logger_->debug("Planned {} items, created {} directories under {}",
                 items.size(), enumerator.directories_created(), destination.string());

  DisplayCoordinator::Options display;
  display.display_cap = config.display_cap;
  display.label_width = config.label_width;
  display.tick = config.refresh_interval;
  display.finished_linger = config.finished_linger;
  display.show_aggregate = shows_aggregate(sources, config.symlinks);
  display.total_items = items.size();
  DisplayCoordinator coordinator(display, make_surface(config), logger_);

  auto channel = ProgressChannel::create(config.channel_capacity);
  auto& receiver = channel.second;
  std::thread display_thread([&]{
    try {
      coordinator.run(receiver);
    } catch(const std::exception& e) {
      logger_->error("Progress display stopped: {}", e.what());
      receiver.close();
    }
  });

  CopyScheduler::Options scheduling;
  scheduling.workers = config.workers;
  scheduling.copier.buffer_size = config.buffer_size;
  scheduling.copier.preserve_permissions = config.preserve_permissions;
  CopyScheduler scheduler(scheduling, logger_);
  RunSummary summary;
  try {
    summary = scheduler.run(items, std::move(channel.first));
  } catch(...) {
    // The sender was released on the way out, so the display drains and exits.
    display_thread.join();
    throw;
  }

  display_thread.join();
  display_stats_ = coordinator.stats();
  summary.skipped = enumerator.skipped();

  const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
  logger_->info("Copied {} of {} items ({}) in {:.2f}s{}",
                summary.items_copied,
                summary.items_planned,
                format_bytes(summary.bytes_copied),
                elapsed,
                summary.items_failed > 0 ? fmt::format(", {} failed", summary.items_failed) : std::string());
  for(const auto& failure : summary.failures) {
    logger_->error("Failed: {}: {}", failure.source.string(), failure.error);
  }
  return summary;
}

int CopyEngine::exit_code(const RunSummary& summary) const {
  const bool strict = settings_->get<bool>("strict");
  if(strict && (summary.items_failed > 0 || !summary.skipped.empty())) return 1;
  return 0;
}

LogListenerHandle CopyEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener), user_data);
}

void CopyEngine::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}
