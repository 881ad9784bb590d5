#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

void init_logging();
void set_log_passthrough(bool enabled);
bool log_passthrough();

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text);
std::string log_level_name(spdlog::level::level_enum level);

using LogListenerHandle = std::size_t;

// Named log channel. Each invocation owns one; the level is per instance so
// nothing process-wide changes when a command raises or lowers verbosity.
class Logger {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger();
  explicit Logger(std::string name);

  const std::string& name() const { return name_; }

  void set_level(spdlog::level::level_enum level) { level_.store(level, std::memory_order_relaxed); }
  spdlog::level::level_enum level() const { return level_.load(std::memory_order_relaxed); }
  bool should_log(spdlog::level::level_enum level) const { return level >= this->level(); }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log("trace", spdlog::level::trace, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log("debug", spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log("info", spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log("warn", spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log("error", spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log("critical", spdlog::level::critical, fmt, std::forward<Args>(args)...);
  }

  // Critical report that ignores the instance level; used for faults, which
  // are reported even when logging is switched off.
  template<typename... Args>
  void fault(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit("critical", spdlog::level::critical, fmt::format(fmt, std::forward<Args>(args)...));
  }

private:
  template<typename... Args>
  void log(const char* channel,
           spdlog::level::level_enum level,
           spdlog::format_string_t<Args...> fmt,
           Args&&... args) {
    if(!should_log(level)) return;
    emit(channel, level, fmt::format(fmt, std::forward<Args>(args)...));
  }

  void emit(const char* channel,
            spdlog::level::level_enum level,
            const std::string& formatted);

  bool dispatch(const std::string& channel,
                spdlog::level::level_enum level,
                const std::string& message);

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  std::string name_;
  std::atomic<spdlog::level::level_enum> level_{spdlog::level::warn};
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
void emit_to_default(const char* base_channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message);
} // namespace detail
