#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <exception>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_log_logger;
std::once_flag g_init_once;
std::atomic<bool> g_log_passthrough{true};

void create_loggers() {
  // Diagnostics share stderr with error reports so stdout stays clean for
  // command output that scripts consume.
  auto log_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  log_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  g_log_logger = std::make_shared<spdlog::logger>("volctl", std::move(log_sink));
  // Filtering happens per Logger instance; the sink passes everything through.
  g_log_logger->set_level(spdlog::level::trace);
  g_log_logger->flush_on(spdlog::level::warn);
}

void ensure_loggers() {
  std::call_once(g_init_once, [](){
    create_loggers();
  });
}

std::string to_lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return out;
}

} // namespace

void init_logging() {
  ensure_loggers();
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text) {
  struct Alias {
    const char* name;
    spdlog::level::level_enum level;
  };
  // panic and fatal are accepted for config files written for other tools.
  static const std::array<Alias, 10> aliases = {{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"fatal", spdlog::level::critical},
    {"critical", spdlog::level::critical},
    {"panic", spdlog::level::critical},
    {"off", spdlog::level::off},
  }};
  const auto lowered = to_lower(text);
  for(const auto& alias : aliases) {
    if(lowered == alias.name) return alias.level;
  }
  return std::nullopt;
}

std::string log_level_name(spdlog::level::level_enum level) {
  switch(level) {
    case spdlog::level::trace: return "trace";
    case spdlog::level::debug: return "debug";
    case spdlog::level::info: return "info";
    case spdlog::level::warn: return "warn";
    case spdlog::level::err: return "error";
    case spdlog::level::critical: return "critical";
    case spdlog::level::off: return "off";
    default: break;
  }
  return "unknown";
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

void Logger::emit(const char* channel,
                  spdlog::level::level_enum level,
                  const std::string& formatted) {
  std::string channel_name = name_.empty()
    ? std::string(channel)
    : name_ + ":" + channel;
  if(dispatch(channel_name, level, formatted)) return;
  detail::emit_to_default(channel, channel_name, level, formatted);
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
                              fmt::format("log listener failed: {}", e.what()));
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

  if(!g_log_logger) return;
  if(!channel_name.empty() && channel_name != base_channel) {
    g_log_logger->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    g_log_logger->log(level, message);
  }
}

} // namespace detail
