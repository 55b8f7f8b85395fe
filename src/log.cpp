#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <cstring>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::once_flag g_init_once;
std::atomic<bool> g_log_passthrough{true};

std::mutex g_console_mutex;
std::size_t g_live_region_height = 0;

using ColorSinkPtr = std::shared_ptr<spdlog::sinks::stdout_color_sink_mt>;
using ErrColorSinkPtr = std::shared_ptr<spdlog::sinks::stderr_color_sink_mt>;
std::vector<ColorSinkPtr> g_out_sinks;
std::vector<ErrColorSinkPtr> g_err_sinks;

void create_loggers() {
  if(g_info_logger) return;

  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_out_sinks = {info_sink, plain_out_sink};
  g_err_sinks = {error_sink, plain_err_sink};

  g_info_logger = std::make_shared<spdlog::logger>("parcopy.info", std::move(info_sink));
  g_error_logger = std::make_shared<spdlog::logger>("parcopy.error", std::move(error_sink));
  g_print_logger = std::make_shared<spdlog::logger>("parcopy.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("parcopy.print_err", std::move(plain_err_sink));

  spdlog::register_logger(g_info_logger);
  spdlog::register_logger(g_error_logger);
  spdlog::register_logger(g_print_logger);
  spdlog::register_logger(g_print_err_logger);

  g_info_logger->flush_on(spdlog::level::debug);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::call_once(g_init_once, [](){
    create_loggers();
  });
}

// Caller holds g_console_mutex.
void erase_live_region_locked() {
  if(g_live_region_height == 0) return;
  std::fprintf(stderr, "\r\x1b[%zuA\x1b[J", g_live_region_height);
  std::fflush(stderr);
  g_live_region_height = 0;
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

std::unique_lock<std::mutex> lock_console() {
  return std::unique_lock<std::mutex>(g_console_mutex);
}

void set_live_region_height(std::size_t lines) {
  g_live_region_height = lines;
}

std::size_t live_region_height() {
  return g_live_region_height;
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      std::fprintf(stderr, "log listener for %s threw: %s\n", channel.c_str(), e.what());
    }
  }
  return handled;
}

void init(bool verbose, bool color) {
  ensure_loggers();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  const auto mode = color ? spdlog::color_mode::automatic : spdlog::color_mode::never;
  for(auto& sink : g_out_sinks) sink->set_color_mode(mode);
  for(auto& sink : g_err_sinks) sink->set_color_mode(mode);

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(level);
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = nullptr;
  if(std::strcmp(base_channel, "print") == 0) {
    sink = g_print_logger.get();
  } else if(std::strcmp(base_channel, "print_err") == 0) {
    sink = g_print_err_logger.get();
  } else if(std::strcmp(base_channel, "error") == 0) {
    sink = g_error_logger.get();
  } else {
    sink = g_info_logger.get();
  }

  if(!sink || !sink->should_log(level)) return;
  auto console = lock_console();
  erase_live_region_locked();
  if(!channel_name.empty() && channel_name != base_channel) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
  sink->flush();
}

} // namespace detail
