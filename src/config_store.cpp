#include "config_store.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

const char* config_tier_name(ConfigTier tier) {
  switch(tier) {
    case ConfigTier::Default: return "default";
    case ConfigTier::File: return "file";
    case ConfigTier::Env: return "env";
    case ConfigTier::Override: return "override";
    case ConfigTier::Flag: return "flag";
  }
  return "unknown";
}

namespace {

// Adds amount * factor milliseconds to total, refusing anything that would
// not fit in a signed 64-bit millisecond count.
bool add_duration_part(const std::string& digits, long long factor, long long& total_ms) {
  long long amount = 0;
  try {
    amount = std::stoll(digits);
  } catch(const std::out_of_range&) {
    return false;
  }
  if(amount > std::numeric_limits<long long>::max() / factor) return false;
  const long long part = amount * factor;
  if(total_ms > std::numeric_limits<long long>::max() - part) return false;
  total_ms += part;
  return true;
}

} // namespace

// Accepts sequences such as "90s", "1m30s", "250ms" or "2h". A bare integer
// is taken as seconds.
bool parse_duration(const std::string& text, std::chrono::milliseconds& out, std::string& error) {
  std::string clean = ConfigStore::trim_copy(text);
  if(clean.empty()) {
    error = "empty duration";
    return false;
  }
  long long total_ms = 0;
  if(std::all_of(clean.begin(), clean.end(), [](unsigned char ch){ return std::isdigit(ch); })) {
    if(!add_duration_part(clean, 1000, total_ms)) {
      error = "duration '" + text + "' is out of range";
      return false;
    }
    out = std::chrono::milliseconds(total_ms);
    return true;
  }

  std::size_t pos = 0;
  while(pos < clean.size()) {
    std::size_t digits_end = pos;
    while(digits_end < clean.size() && std::isdigit(static_cast<unsigned char>(clean[digits_end]))) {
      ++digits_end;
    }
    if(digits_end == pos) {
      error = "invalid duration '" + text + "'";
      return false;
    }
    std::size_t unit_end = digits_end;
    while(unit_end < clean.size() && std::isalpha(static_cast<unsigned char>(clean[unit_end]))) {
      ++unit_end;
    }
    const std::string unit = clean.substr(digits_end, unit_end - digits_end);
    long long factor = 0;
    if(unit == "ms") {
      factor = 1;
    } else if(unit == "s") {
      factor = 1000;
    } else if(unit == "m") {
      factor = 60 * 1000;
    } else if(unit == "h") {
      factor = 60 * 60 * 1000;
    } else {
      error = "unknown unit '" + unit + "' in duration '" + text + "'";
      return false;
    }
    if(!add_duration_part(clean.substr(pos, digits_end - pos), factor, total_ms)) {
      error = "duration '" + text + "' is out of range";
      return false;
    }
    pos = unit_end;
  }
  out = std::chrono::milliseconds(total_ms);
  return true;
}

std::string format_duration(std::chrono::milliseconds value) {
  auto ms = value.count();
  if(ms == 0) return "0s";
  std::string out;
  const long long hours = ms / 3600000;
  ms %= 3600000;
  const long long minutes = ms / 60000;
  ms %= 60000;
  const long long seconds = ms / 1000;
  ms %= 1000;
  if(hours) out += std::to_string(hours) + "h";
  if(minutes) out += std::to_string(minutes) + "m";
  if(seconds) out += std::to_string(seconds) + "s";
  if(ms) out += std::to_string(ms) + "ms";
  return out;
}

std::vector<ConfigStore::ConfigSpec> ConfigStore::build_config_specs(const nlohmann::json& specification) {
  std::vector<ConfigSpec> result;
  for(const auto& entry : specification) {
    ConfigSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.type = entry.at("type").get<std::string>();
    spec.env = entry.value("env", "");
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    result.push_back(std::move(spec));
  }
  return result;
}

ConfigStore::ConfigStore()
  : ConfigStore(CONFIG_SPECIFICATION) {}

ConfigStore::ConfigStore(const nlohmann::json& specification)
  : config_specs_(build_config_specs(specification)) {
  for(auto& tier : tiers_) {
    tier = nlohmann::json::object();
  }
  for(const auto& spec : config_specs_) {
    nlohmann::json value;
    std::string error;
    if(!convert(spec, spec.default_value, value, error)) {
      throw std::invalid_argument("invalid default for " + spec.key + ": " + error);
    }
    tiers_[static_cast<std::size_t>(ConfigTier::Default)][spec.key] = value;
  }
}

const ConfigStore::ConfigSpec* ConfigStore::find_spec(const std::string& key) const {
  for(const auto& spec : config_specs_) {
    if(spec.key == key) return &spec;
  }
  return nullptr;
}

std::string ConfigStore::type_of(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec ? spec->type : "json";
}

bool ConfigStore::convert(const ConfigSpec& spec,
                          const nlohmann::json& value,
                          nlohmann::json& out,
                          std::string& error) const {
  if(value.is_string() && spec.type != "string") {
    auto parsed = parse_string_value(spec, value.get<std::string>(), error);
    if(!error.empty()) return false;
    out = std::move(parsed);
    return true;
  }
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      out = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      out = (value.get<long long>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) {
      out = value.get<long long>();
      return true;
    }
    error = "expected integer";
    return false;
  }
  if(spec.type == "duration") {
    if(value.is_number_integer() && value.get<long long>() >= 0) {
      out = value.get<long long>();
      return true;
    }
    error = "expected non-negative duration";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      out = value.get<std::string>();
      return true;
    }
    if(value.is_number() || value.is_boolean()) {
      out = value.dump();
      return true;
    }
    error = "expected string";
    return false;
  }
  error = "unknown type '" + spec.type + "'";
  return false;
}

nlohmann::json ConfigStore::parse_string_value(const ConfigSpec& spec,
                                               const std::string& value,
                                               std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t consumed = 0;
      auto parsed = std::stoll(clean, &consumed);
      if(consumed != clean.size()) {
        error = "expected integer";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "duration") {
    std::chrono::milliseconds parsed{0};
    if(!parse_duration(clean, parsed, error)) return {};
    return parsed.count();
  }
  if(spec.type == "string") {
    return clean;
  }
  error = "unsupported type";
  return {};
}

bool ConfigStore::set(const std::string& key,
                      const nlohmann::json& value,
                      ConfigTier tier,
                      std::string& error) {
  error.clear();
  auto& slot = tiers_[static_cast<std::size_t>(tier)];
  const auto* spec = find_spec(key);
  if(!spec) {
    slot[key] = value;
    return true;
  }
  nlohmann::json converted;
  if(!convert(*spec, value, converted, error)) {
    error = key + ": " + error;
    return false;
  }
  slot[key] = std::move(converted);
  return true;
}

bool ConfigStore::set_from_string(const std::string& key,
                                  const std::string& value,
                                  ConfigTier tier,
                                  std::string& error) {
  error.clear();
  const auto* spec = find_spec(key);
  if(!spec) {
    tiers_[static_cast<std::size_t>(tier)][key] = value;
    return true;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) {
    error = key + ": " + error;
    return false;
  }
  tiers_[static_cast<std::size_t>(tier)][key] = std::move(parsed);
  return true;
}

void ConfigStore::clear_tier(ConfigTier tier) {
  if(tier == ConfigTier::Default) return;
  tiers_[static_cast<std::size_t>(tier)] = nlohmann::json::object();
}

const nlohmann::json* ConfigStore::effective(const std::string& key) const {
  for(std::size_t i = kTierCount; i-- > 0;) {
    const auto& tier = tiers_[i];
    auto it = tier.find(key);
    if(it != tier.end()) return &*it;
  }
  return nullptr;
}

bool ConfigStore::has(const std::string& key) const {
  return effective(key) != nullptr;
}

std::optional<ConfigTier> ConfigStore::source(const std::string& key) const {
  for(std::size_t i = kTierCount; i-- > 0;) {
    if(tiers_[i].contains(key)) return static_cast<ConfigTier>(i);
  }
  return std::nullopt;
}

std::string ConfigStore::get_string(const std::string& key) const {
  const auto* value = effective(key);
  if(!value || value->is_null()) return "";
  if(value->is_string()) return value->get<std::string>();
  return value_as_string(key);
}

bool ConfigStore::get_bool(const std::string& key) const {
  const auto* value = effective(key);
  if(!value) return false;
  if(value->is_boolean()) return value->get<bool>();
  if(value->is_number_integer()) return value->get<long long>() != 0;
  if(value->is_string()) {
    auto v = to_lower(trim_copy(value->get<std::string>()));
    return v == "true" || v == "1" || v == "on" || v == "yes";
  }
  return false;
}

long long ConfigStore::get_int(const std::string& key) const {
  const auto* value = effective(key);
  if(!value) return 0;
  if(value->is_number_integer()) return value->get<long long>();
  if(value->is_string()) {
    try {
      return std::stoll(value->get<std::string>());
    } catch(const std::exception&) {
      return 0;
    }
  }
  return 0;
}

std::chrono::milliseconds ConfigStore::get_duration(const std::string& key) const {
  const auto* value = effective(key);
  if(!value) return std::chrono::milliseconds(0);
  if(value->is_number_integer()) return std::chrono::milliseconds(value->get<long long>());
  if(value->is_string()) {
    std::chrono::milliseconds parsed{0};
    std::string error;
    if(parse_duration(value->get<std::string>(), parsed, error)) return parsed;
  }
  return std::chrono::milliseconds(0);
}

std::string ConfigStore::env_name(const std::string& key) const {
  if(const auto* spec = find_spec(key); spec && !spec->env.empty()) {
    return spec->env;
  }
  std::string out;
  out.reserve(key.size());
  for(char ch : key) {
    out.push_back(ch == '.' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
  }
  return out;
}

void ConfigStore::load_environment(const EnvLookup& lookup, std::vector<std::string>& warnings) {
  if(!lookup) return;
  for(const auto& spec : config_specs_) {
    auto raw = lookup(env_name(spec.key));
    if(!raw) continue;
    std::string error;
    if(!set_from_string(spec.key, *raw, ConfigTier::Env, error)) {
      warnings.push_back("ignoring " + env_name(spec.key) + ": " + error);
    }
  }
}

void ConfigStore::flatten(const nlohmann::json& doc,
                          const std::string& prefix,
                          std::vector<std::pair<std::string, nlohmann::json>>& out) const {
  for(const auto& item : doc.items()) {
    std::string key = prefix.empty() ? item.key() : prefix + "." + item.key();
    if(item.value().is_object()) {
      flatten(item.value(), key, out);
    } else {
      out.emplace_back(std::move(key), item.value());
    }
  }
}

bool ConfigStore::merge_document(const nlohmann::json& doc, ConfigTier tier, std::string& error) {
  if(!doc.is_object()) {
    error = "configuration document must be a JSON object";
    return false;
  }
  std::vector<std::pair<std::string, nlohmann::json>> entries;
  flatten(doc, "", entries);
  // Convert everything first so a bad entry leaves the tier untouched.
  nlohmann::json staged = nlohmann::json::object();
  for(const auto& [key, value] : entries) {
    const auto* spec = find_spec(key);
    if(!spec) {
      staged[key] = value;
      continue;
    }
    nlohmann::json converted;
    if(!convert(*spec, value, converted, error)) {
      error = key + ": " + error;
      return false;
    }
    staged[key] = std::move(converted);
  }
  auto& slot = tiers_[static_cast<std::size_t>(tier)];
  for(const auto& item : staged.items()) {
    slot[item.key()] = item.value();
  }
  return true;
}

bool ConfigStore::read_file(const std::filesystem::path& path, std::string& error) {
  std::ifstream in(path);
  if(!in) {
    error = "unable to open " + path.string();
    return false;
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const std::exception& e) {
    error = "failed to parse " + path.string() + ": " + e.what();
    return false;
  }
  return merge_document(doc, ConfigTier::File, error);
}

std::vector<std::string> ConfigStore::keys() const {
  std::vector<std::string> out;
  for(const auto& tier : tiers_) {
    for(const auto& item : tier.items()) {
      if(std::find(out.begin(), out.end(), item.key()) == out.end()) {
        out.push_back(item.key());
      }
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::string ConfigStore::value_as_string(const std::string& key) const {
  const auto* value = effective(key);
  if(!value) return "";
  if(type_of(key) == "duration" && value->is_number_integer()) {
    return format_duration(std::chrono::milliseconds(value->get<long long>()));
  }
  if(value->is_string()) return value->get<std::string>();
  if(value->is_boolean()) return value->get<bool>() ? "true" : "false";
  return value->dump();
}

ConfigStore::EnvLookup ConfigStore::process_environment() {
  return [](const std::string& name) -> std::optional<std::string> {
    if(const char* value = std::getenv(name.c_str())) {
      return std::string(value);
    }
    return std::nullopt;
  };
}

std::string ConfigStore::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string ConfigStore::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}
