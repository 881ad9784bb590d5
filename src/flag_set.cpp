#include "flag_set.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <stdexcept>

#include "config_store.hpp"

const char* flag_type_name(FlagType type) {
  switch(type) {
    case FlagType::String: return "string";
    case FlagType::Bool: return "bool";
    case FlagType::Int: return "int";
    case FlagType::Duration: return "duration";
    case FlagType::StringList: return "strings";
  }
  return "unknown";
}

FlagSpec string_flag(std::string name, std::string shorthand, std::string default_value, std::string usage) {
  FlagSpec spec;
  spec.name = std::move(name);
  spec.shorthand = std::move(shorthand);
  spec.type = FlagType::String;
  spec.default_value = std::move(default_value);
  spec.usage = std::move(usage);
  return spec;
}

FlagSpec bool_flag(std::string name, std::string shorthand, bool default_value, std::string usage) {
  FlagSpec spec;
  spec.name = std::move(name);
  spec.shorthand = std::move(shorthand);
  spec.type = FlagType::Bool;
  spec.default_value = default_value;
  spec.usage = std::move(usage);
  return spec;
}

FlagSpec int_flag(std::string name, std::string shorthand, long long default_value, std::string usage) {
  FlagSpec spec;
  spec.name = std::move(name);
  spec.shorthand = std::move(shorthand);
  spec.type = FlagType::Int;
  spec.default_value = default_value;
  spec.usage = std::move(usage);
  return spec;
}

FlagSpec duration_flag(std::string name, std::string shorthand, std::string default_value, std::string usage) {
  FlagSpec spec;
  spec.name = std::move(name);
  spec.shorthand = std::move(shorthand);
  spec.type = FlagType::Duration;
  std::chrono::milliseconds parsed{0};
  std::string error;
  if(!parse_duration(default_value, parsed, error)) {
    throw std::invalid_argument("invalid default for --" + spec.name + ": " + error);
  }
  spec.default_value = parsed.count();
  spec.usage = std::move(usage);
  return spec;
}

FlagSpec list_flag(std::string name, std::string shorthand, std::string usage) {
  FlagSpec spec;
  spec.name = std::move(name);
  spec.shorthand = std::move(shorthand);
  spec.type = FlagType::StringList;
  spec.default_value = nlohmann::json::array();
  spec.usage = std::move(usage);
  return spec;
}

// ---- ParsedFlags -----------------------------------------------------------

const nlohmann::json& ParsedFlags::value(const std::string& name) const {
  static const nlohmann::json null_value;
  auto it = values_.find(name);
  if(it == values_.end()) return null_value;
  return *it;
}

std::string ParsedFlags::get_string(const std::string& name) const {
  const auto& v = value(name);
  if(v.is_string()) return v.get<std::string>();
  if(v.is_null()) return "";
  return v.dump();
}

bool ParsedFlags::get_bool(const std::string& name) const {
  const auto& v = value(name);
  return v.is_boolean() && v.get<bool>();
}

long long ParsedFlags::get_int(const std::string& name) const {
  const auto& v = value(name);
  return v.is_number_integer() ? v.get<long long>() : 0;
}

std::chrono::milliseconds ParsedFlags::get_duration(const std::string& name) const {
  return std::chrono::milliseconds(get_int(name));
}

std::vector<std::string> ParsedFlags::get_list(const std::string& name) const {
  const auto& v = value(name);
  if(!v.is_array()) return {};
  return v.get<std::vector<std::string>>();
}

void ParsedFlags::set_default(const FlagSpec& spec) {
  if(!values_.contains(spec.name)) {
    values_[spec.name] = spec.default_value;
  }
}

void ParsedFlags::set(const std::string& name, nlohmann::json value) {
  values_[name] = std::move(value);
  changed_.insert(name);
}

void ParsedFlags::append(const std::string& name, const std::string& value) {
  if(!changed(name) || !values_[name].is_array()) {
    values_[name] = nlohmann::json::array();
  }
  values_[name].push_back(value);
  changed_.insert(name);
}

void ParsedFlags::clear() {
  values_ = nlohmann::json::object();
  changed_.clear();
}

// ---- FlagParser ------------------------------------------------------------

FlagParser::FlagParser(std::vector<const FlagSpec*> visible)
  : visible_(std::move(visible)) {}

const FlagSpec* FlagParser::find_long(const std::string& name) const {
  for(const auto* spec : visible_) {
    if(spec->name == name) return spec;
  }
  return nullptr;
}

const FlagSpec* FlagParser::find_short(char shorthand) const {
  for(const auto* spec : visible_) {
    if(spec->shorthand.size() == 1 && spec->shorthand[0] == shorthand) return spec;
  }
  return nullptr;
}

bool FlagParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return candidate.size() > 2;
  if(candidate.size() >= 2 && candidate[0] == '-' &&
     !std::isdigit(static_cast<unsigned char>(candidate[1]))) {
    return true;
  }
  return false;
}

bool FlagParser::consumes_next(const std::string& token, const std::string* next) const {
  if(!is_option_token(token)) return false;

  if(token.rfind("--", 0) == 0) {
    if(token.find('=') != std::string::npos) return false;
    const auto* spec = find_long(token.substr(2));
    if(!spec) return false;
    if(spec->type == FlagType::Bool) return false;
    return next != nullptr;
  }

  for(std::size_t pos = 1; pos < token.size(); ++pos) {
    const auto* spec = find_short(token[pos]);
    if(!spec) return false;
    const bool last = (pos + 1 == token.size());
    if(spec->type == FlagType::Bool) {
      if(last || token[pos + 1] == '=') return false;
      continue;
    }
    return last && next != nullptr;
  }
  return false;
}

bool FlagParser::assign(const FlagSpec& spec, const std::string& raw, ParsedFlags& out, std::string& error) const {
  std::string value = ConfigStore::trim_copy(raw);
  switch(spec.type) {
    case FlagType::String:
      out.set(spec.name, raw);
      return true;
    case FlagType::Bool: {
      std::string lowered = ConfigStore::to_lower(value);
      if(lowered == "true" || lowered == "1" || lowered == "on" || lowered == "yes") {
        out.set(spec.name, true);
        return true;
      }
      if(lowered == "false" || lowered == "0" || lowered == "off" || lowered == "no") {
        out.set(spec.name, false);
        return true;
      }
      error = "invalid argument \"" + raw + "\" for \"--" + spec.name + "\" flag: expected boolean";
      return false;
    }
    case FlagType::Int: {
      try {
        std::size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if(consumed != value.size()) throw std::invalid_argument("trailing characters");
        out.set(spec.name, parsed);
        return true;
      } catch(const std::exception&) {
        error = "invalid argument \"" + raw + "\" for \"--" + spec.name + "\" flag: expected integer";
        return false;
      }
    }
    case FlagType::Duration: {
      std::chrono::milliseconds parsed{0};
      std::string reason;
      if(!parse_duration(value, parsed, reason)) {
        error = "invalid argument \"" + raw + "\" for \"--" + spec.name + "\" flag: " + reason;
        return false;
      }
      out.set(spec.name, parsed.count());
      return true;
    }
    case FlagType::StringList: {
      std::size_t start = 0;
      while(start <= raw.size()) {
        auto comma = raw.find(',', start);
        auto piece = ConfigStore::trim_copy(raw.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if(!piece.empty()) out.append(spec.name, piece);
        if(comma == std::string::npos) break;
        start = comma + 1;
      }
      return true;
    }
  }
  error = "unsupported flag type";
  return false;
}

bool FlagParser::parse(const std::vector<std::string>& tokens,
                       ParsedFlags& out,
                       std::vector<std::string>& positional,
                       std::string& error) const {
  for(const auto* spec : visible_) {
    out.set_default(*spec);
  }

  for(std::size_t i = 0; i < tokens.size(); ++i) {
    const std::string& token = tokens[i];

    if(token == "--") {
      positional.insert(positional.end(), tokens.begin() + static_cast<std::ptrdiff_t>(i) + 1, tokens.end());
      return true;
    }

    if(!is_option_token(token)) {
      positional.push_back(token);
      continue;
    }

    if(token.rfind("--", 0) == 0) {
      std::string body = token.substr(2);
      std::string name = body;
      std::optional<std::string> inline_value;
      if(auto eq = body.find('='); eq != std::string::npos) {
        name = body.substr(0, eq);
        inline_value = body.substr(eq + 1);
      }
      const auto* spec = find_long(name);
      if(!spec) {
        error = "unknown flag: --" + name;
        return false;
      }
      if(inline_value) {
        if(!assign(*spec, *inline_value, out, error)) return false;
        continue;
      }
      // A bool only takes a value through '='; the next token is never its value.
      if(spec->type == FlagType::Bool) {
        out.set(spec->name, true);
        continue;
      }
      if(i + 1 >= tokens.size()) {
        error = "flag needs an argument: --" + name;
        return false;
      }
      if(!assign(*spec, tokens[++i], out, error)) return false;
      continue;
    }

    // Short form: -f json, -fjson, -f=json, or grouped bools such as -qn.
    for(std::size_t pos = 1; pos < token.size(); ++pos) {
      const char shorthand = token[pos];
      const auto* spec = find_short(shorthand);
      if(!spec) {
        error = std::string("unknown shorthand flag: '") + shorthand + "' in " + token;
        return false;
      }
      std::string rest = token.substr(pos + 1);
      if(!rest.empty() && rest[0] == '=') {
        if(!assign(*spec, rest.substr(1), out, error)) return false;
        break;
      }
      if(spec->type == FlagType::Bool) {
        out.set(spec->name, true);
        continue;
      }
      if(!rest.empty()) {
        if(!assign(*spec, rest, out, error)) return false;
        break;
      }
      if(i + 1 >= tokens.size()) {
        error = std::string("flag needs an argument: '") + shorthand + "' in -" + shorthand;
        return false;
      }
      if(!assign(*spec, tokens[++i], out, error)) return false;
      break;
    }
  }
  return true;
}
