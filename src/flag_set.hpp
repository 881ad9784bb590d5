#pragma once

#include <chrono>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

enum class FlagType {
  String,
  Bool,
  Int,
  Duration,
  StringList,
};

const char* flag_type_name(FlagType type);

struct FlagSpec {
  std::string name;
  std::string shorthand;        // one character, or empty
  FlagType type = FlagType::String;
  nlohmann::json default_value;
  std::string usage;
  std::string config_key;       // written to the Flag tier when set
  bool persistent = false;      // visible to every descendant command
};

FlagSpec string_flag(std::string name, std::string shorthand, std::string default_value, std::string usage);
FlagSpec bool_flag(std::string name, std::string shorthand, bool default_value, std::string usage);
FlagSpec int_flag(std::string name, std::string shorthand, long long default_value, std::string usage);
FlagSpec duration_flag(std::string name, std::string shorthand, std::string default_value, std::string usage);
FlagSpec list_flag(std::string name, std::string shorthand, std::string usage);

class ParsedFlags {
public:
  bool has(const std::string& name) const { return values_.contains(name); }
  bool changed(const std::string& name) const { return changed_.count(name) != 0; }

  std::string get_string(const std::string& name) const;
  bool get_bool(const std::string& name) const;
  long long get_int(const std::string& name) const;
  std::chrono::milliseconds get_duration(const std::string& name) const;
  std::vector<std::string> get_list(const std::string& name) const;
  const nlohmann::json& value(const std::string& name) const;

  void set_default(const FlagSpec& spec);
  void set(const std::string& name, nlohmann::json value);
  void append(const std::string& name, const std::string& value);
  void clear();

private:
  nlohmann::json values_ = nlohmann::json::object();
  std::set<std::string> changed_;
};

// Parses tokens against the flags visible at one command.
class FlagParser {
public:
  explicit FlagParser(std::vector<const FlagSpec*> visible);

  bool parse(const std::vector<std::string>& tokens,
             ParsedFlags& out,
             std::vector<std::string>& positional,
             std::string& error) const;

  const FlagSpec* find_long(const std::string& name) const;
  const FlagSpec* find_short(char shorthand) const;

  // True when a flag token leaves its value in the following token.
  bool consumes_next(const std::string& token, const std::string* next) const;

  static bool is_option_token(const std::string& candidate);

private:
  bool assign(const FlagSpec& spec, const std::string& raw, ParsedFlags& out, std::string& error) const;

  std::vector<const FlagSpec*> visible_;
};
