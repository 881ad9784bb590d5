#include "config_validator.hpp"

#include <fstream>
#include <iterator>

#include <nlohmann/json.hpp>

#include "config_store.hpp"

namespace {

void collect(const nlohmann::json& doc,
             const std::string& prefix,
             std::vector<std::pair<std::string, const nlohmann::json*>>& out) {
  for(const auto& item : doc.items()) {
    const auto key = prefix.empty() ? item.key() : prefix + "." + item.key();
    if(item.value().is_object()) {
      collect(item.value(), key, out);
    } else {
      out.emplace_back(key, &item.value());
    }
  }
}

bool matches_type(const std::string& type, const nlohmann::json& value) {
  if(type == "string") return value.is_string() || value.is_number() || value.is_boolean();
  if(type == "bool") return value.is_boolean() || value.is_string();
  if(type == "int") return value.is_number_integer() || value.is_string();
  if(type == "duration") return value.is_string() || value.is_number_integer();
  return true;
}

} // namespace

bool JsonConfigValidator::validate(const std::filesystem::path& path,
                                   const ConfigStore& config,
                                   std::vector<std::string>& warnings,
                                   std::string& error) const {
  std::ifstream in(path);
  if(!in) {
    error = "unable to open " + path.string();
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  const auto doc = nlohmann::json::parse(text, nullptr, false);
  if(doc.is_discarded()) {
    error = path.string() + " is not valid JSON";
    return false;
  }
  if(!doc.is_object()) {
    error = path.string() + " must contain a JSON object";
    return false;
  }

  std::vector<std::pair<std::string, const nlohmann::json*>> entries;
  collect(doc, "", entries);
  for(const auto& [key, value] : entries) {
    if(!config.is_known(key)) {
      warnings.push_back(path.string() + ": unknown key " + key);
      continue;
    }
    const auto type = config.type_of(key);
    if(!matches_type(type, *value)) {
      error = path.string() + ": " + key + " must be a " + type + " (got " + value->dump() + ")";
      return false;
    }
  }
  return true;
}
