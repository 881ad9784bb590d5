#pragma once

#include "log.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace volctl::test {

// Collects log lines from every logger a test attaches, tagged with the
// label so interleaved service and CLI output stays readable on failure.
class LogCapture {
public:
  LogCapture() = default;
  ~LogCapture() { detach_all(); }

  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  void attach(const std::shared_ptr<Logger>& logger, const std::string& label) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](void*,
                    const std::string&,
                    spdlog::level::level_enum level,
                    const std::string& message) {
        record(label + " [" + log_level_name(level) + "] " + message);
        return false;
      });
    std::lock_guard<std::mutex> lock(mutex_);
    attached_.emplace_back(logger, handle);
  }

  void detach_all() {
    std::vector<std::pair<std::shared_ptr<Logger>, LogListenerHandle>> attached;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      attached.swap(attached_);
    }
    for(auto& entry : attached) {
      entry.first->remove_listener(entry.second);
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for(const auto& line : lines_) {
      if(line.find(needle) != std::string::npos) return true;
    }
    return false;
  }

private:
  void record(std::string line) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(std::move(line));
  }

  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
  std::vector<std::pair<std::shared_ptr<Logger>, LogListenerHandle>> attached_;
};

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
  std::vector<std::string> notes;

  // Records why a check failed; the runner prints notes for failing cases.
  bool expect(bool condition, const std::string& what) {
    if(!condition) notes.push_back(what);
    return condition;
  }
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

// Scratch directory removed when the test finishes.
class TempDir {
public:
  explicit TempDir(const std::string& label) {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("volctl_test_" + label + "_" + std::to_string(counter.fetch_add(1)));
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

  std::filesystem::path write(const std::string& name, const std::string& content) const {
    auto file = path_ / name;
    std::ofstream out(file, std::ios::trunc);
    out << content;
    return file;
  }

  std::filesystem::path write_json(const std::string& name, const nlohmann::json& content) const {
    return write(name, content.dump(2));
  }

private:
  std::filesystem::path path_;
};

// Environment stand-in handed to ConfigStore and the Runner instead of the
// process environment.
class FakeEnvironment {
public:
  void set(const std::string& name, const std::string& value) { values_[name] = value; }

  std::function<std::optional<std::string>(const std::string&)> lookup() const {
    auto values = values_;
    return [values](const std::string& name) -> std::optional<std::string> {
      auto it = values.find(name);
      if(it == values.end()) return std::nullopt;
      return it->second;
    };
  }

private:
  std::map<std::string, std::string> values_;
};

inline bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

std::vector<TestCase> config_store_tests();
std::vector<TestCase> command_tree_tests();
std::vector<TestCase> error_presenter_tests();
std::vector<TestCase> lifecycle_tests();
std::vector<TestCase> storage_tests();

} // namespace volctl::test
