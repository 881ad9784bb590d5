#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

inline const nlohmann::json CONFIG_SPECIFICATION = nlohmann::json::array({
  {{"key","volctl.configFile"},      {"type","string"},   {"default",""},        {"env","VOLCTL_CONFIG_FILE"}, {"description","Path to the JSON configuration file"}},
  {{"key","volctl.logLevel"},        {"type","string"},   {"default","warn"},    {"description","Log level (trace, debug, info, warn, error, critical, off)"}},
  {{"key","volctl.host"},            {"type","string"},   {"default",""},        {"description","Address of the storage service to use"}},
  {{"key","volctl.service"},         {"type","string"},   {"default",""},        {"description","Name of the storage service to use"}},
  {{"key","volctl.cli.format"},      {"type","string"},   {"default","tmpl"},    {"description","Output format (tmpl, json, jsonp)"}},
  {{"key","volctl.cli.template"},    {"type","string"},   {"default",""},        {"description","Output template used by the tmpl format"}},
  {{"key","volctl.cli.templateTabs"},{"type","bool"},     {"default",true},      {"description","Align template output into columns"}},
  {{"key","volctl.cli.requireRoot"}, {"type","bool"},     {"default",false},     {"description","Require root for install and service control"}},
  {{"key","volctl.integration.volume.operations.path.cache.enabled"}, {"type","bool"}, {"default",true}, {"description","Cache volume path lookups"}},
  {{"key","volctl.service.listen"},  {"type","string"},   {"default","127.0.0.1:7979"}, {"description","Address the service daemon listens on"}},
  {{"key","volctl.service.pidFile"}, {"type","string"},   {"default","/var/run/volctl.pid"}, {"description","PID file written by the service daemon"}},
  {{"key","volctl.service.unitFile"},{"type","string"},   {"default","/etc/systemd/system/volctl.service"}, {"description","systemd unit written by install"}},
  {{"key","storage.host"},           {"type","string"},   {"default",""},        {"description","Storage service address used by the client"}},
  {{"key","storage.service"},        {"type","string"},   {"default","default"}, {"description","Storage service name used by the client"}},
  {{"key","storage.client.timeout"}, {"type","duration"}, {"default","30s"},     {"description","Client connect and request timeout"}}
});

// Tiers in increasing priority. Override holds values the CLI derives for
// itself; they beat file and environment but never an explicit flag.
enum class ConfigTier : std::size_t {
  Default = 0,
  File = 1,
  Env = 2,
  Override = 3,
  Flag = 4,
};

const char* config_tier_name(ConfigTier tier);

bool parse_duration(const std::string& text, std::chrono::milliseconds& out, std::string& error);
std::string format_duration(std::chrono::milliseconds value);

class ConfigStore {
public:
  using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

  ConfigStore();
  explicit ConfigStore(const nlohmann::json& specification);

  bool set(const std::string& key, const nlohmann::json& value, ConfigTier tier, std::string& error);
  bool set_from_string(const std::string& key, const std::string& value, ConfigTier tier, std::string& error);
  void clear_tier(ConfigTier tier);

  bool has(const std::string& key) const;
  std::optional<ConfigTier> source(const std::string& key) const;
  const nlohmann::json* effective(const std::string& key) const;

  std::string get_string(const std::string& key) const;
  bool get_bool(const std::string& key) const;
  long long get_int(const std::string& key) const;
  std::chrono::milliseconds get_duration(const std::string& key) const;

  // Reads every specification key's environment variable into the Env tier.
  // Values that do not parse are skipped and reported through warnings.
  void load_environment(const EnvLookup& lookup, std::vector<std::string>& warnings);
  bool merge_document(const nlohmann::json& doc, ConfigTier tier, std::string& error);
  bool read_file(const std::filesystem::path& path, std::string& error);

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::string env_name(const std::string& key) const;
  bool is_known(const std::string& key) const { return find_spec(key) != nullptr; }
  std::string type_of(const std::string& key) const;


  static EnvLookup process_environment();
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  struct ConfigSpec {
    std::string key;
    std::string type;
    std::string env;
    nlohmann::json default_value;
    std::string description;
  };

  static std::vector<ConfigSpec> build_config_specs(const nlohmann::json& specification);
  const ConfigSpec* find_spec(const std::string& key) const;

  bool convert(const ConfigSpec& spec, const nlohmann::json& value, nlohmann::json& out, std::string& error) const;
  nlohmann::json parse_string_value(const ConfigSpec& spec, const std::string& value, std::string& error) const;
  void flatten(const nlohmann::json& doc, const std::string& prefix, std::vector<std::pair<std::string, nlohmann::json>>& out) const;

  static constexpr std::size_t kTierCount = 5;

  std::vector<ConfigSpec> config_specs_;
  std::array<nlohmann::json, kTierCount> tiers_;
};
