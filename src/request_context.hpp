#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

// Request-scoped values handed to nested operations (log level, async mode,
// the service the client talks to).
class RequestContext {
public:
  void set(const std::string& key, nlohmann::json value) { values_[key] = std::move(value); }

  bool flag(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() && it->is_boolean() && it->get<bool>();
  }

  std::string text(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() && it->is_string() ? it->get<std::string>() : std::string();
  }

  void set_log_level(spdlog::level::level_enum level) { log_level_ = level; }
  std::optional<spdlog::level::level_enum> log_level() const { return log_level_; }

private:
  nlohmann::json values_ = nlohmann::json::object();
  std::optional<spdlog::level::level_enum> log_level_;
};
