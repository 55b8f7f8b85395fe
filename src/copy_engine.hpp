#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "copy_types.hpp"
#include "display_coordinator.hpp"
#include "log.hpp"
#include "progress_surface.hpp"

class SettingsManager;

// Control thread of one copy run: enumerates, starts the display coordinator
// thread, runs the worker pool, closes the channel and joins the display.
class CopyEngine {
public:
  // Resolved, validated settings for one run.
  struct Config {
    std::size_t workers = 0;
    std::size_t display_cap = 8;
    std::size_t buffer_size = 64 * 1024;
    SymlinkPolicy symlinks = SymlinkPolicy::Recreate;
    bool progress = true;
    std::size_t label_width = 30;
    std::chrono::milliseconds refresh_interval{100};
    std::chrono::milliseconds finished_linger{0};
    std::size_t channel_capacity = 1024;
    bool preserve_permissions = true;
    bool strict = false;
    bool color = true;
  };

  using SurfaceFactory = std::function<std::unique_ptr<ProgressSurface>(const Config&)>;

  struct Options {
    Options();
    std::string name = "parcopy";
    // Overrides the terminal/log surface choice.
    SurfaceFactory surface_factory;
  };

  explicit CopyEngine(std::shared_ptr<SettingsManager> settings, Options options = Options());

  // Throws CopyError for usage errors and fatal pre-flight failures (missing
  // source, destination directory that cannot be created). Per-item failures
  // are reported in the summary.
  RunSummary run(const std::vector<std::filesystem::path>& sources,
                 const std::filesystem::path& destination);

  int exit_code(const RunSummary& summary) const;

  // Throws CopyError(Usage) on out-of-range values.
  static Config config_from_settings(const SettingsManager& settings);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  const DisplayCoordinator::Stats& display_stats() const { return display_stats_; }

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);

private:
  std::unique_ptr<ProgressSurface> make_surface(const Config& config) const;
  bool shows_aggregate(const std::vector<std::filesystem::path>& sources, SymlinkPolicy policy) const;

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  DisplayCoordinator::Stats display_stats_;
};

inline CopyEngine::Options::Options() = default;
