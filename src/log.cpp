#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <cstring>
#include <exception>
#include <mutex>
#include <vector>

namespace {
constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kPlainPattern = "%v";

std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};

template<typename Sink>
std::shared_ptr<spdlog::logger> make_console_logger(const std::string& name,
                                                    const char* pattern,
                                                    spdlog::level::level_enum flush_level) {
  auto sink = std::make_shared<Sink>();
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  // A host application may already own a logger with this name.
  if(!spdlog::get(name)) {
    spdlog::register_logger(logger);
  }
  return logger;
}

void create_loggers() {
  using spdlog::sinks::stderr_color_sink_mt;
  using spdlog::sinks::stdout_color_sink_mt;
  g_info_logger = make_console_logger<stdout_color_sink_mt>("chunkup.info", kStampedPattern, spdlog::level::warn);
  g_error_logger = make_console_logger<stderr_color_sink_mt>("chunkup.error", kStampedPattern, spdlog::level::err);
  g_print_logger = make_console_logger<stdout_color_sink_mt>("chunkup.print", kPlainPattern, spdlog::level::info);
  g_print_err_logger = make_console_logger<stderr_color_sink_mt>("chunkup.print_err", kPlainPattern, spdlog::level::err);
}

void ensure_loggers() {
  std::call_once(g_create_once, create_loggers);
}

spdlog::logger* sink_for(const char* base_channel) {
  if(std::strcmp(base_channel, "print") == 0) return g_print_logger.get();
  if(std::strcmp(base_channel, "print_err") == 0) return g_print_err_logger.get();
  if(std::strcmp(base_channel, "error") == 0) return g_error_logger.get();
  return g_info_logger.get();
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose) {
  ensure_loggers();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

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

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

void Logger::write(const char* channel,
                   spdlog::level::level_enum level,
                   const std::string& message) {
  std::string channel_name = name_.empty()
    ? std::string(channel)
    : name_ + ":" + channel;
  if(dispatch(channel_name, level, message)) return;
  detail::emit_to_default(channel, channel_name, level, message);
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
      detail::emit_to_default("error", channel, spdlog::level::err,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = sink_for(base_channel);
  if(!sink) return;
  if(!channel_name.empty() && channel_name != base_channel) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
