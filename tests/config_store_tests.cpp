#include "config_store.hpp"
#include "config_validator.hpp"
#include "test_runner_utils.hpp"

namespace volctl::test {
namespace {

bool test_defaults_from_specification(TestContext& ctx) {
  ConfigStore config;
  bool ok = true;
  ok &= ctx.expect(config.get_string("volctl.logLevel") == "warn", "logLevel default");
  ok &= ctx.expect(config.get_string("volctl.cli.format") == "tmpl", "format default");
  ok &= ctx.expect(config.get_bool("volctl.cli.templateTabs"), "templateTabs default");
  ok &= ctx.expect(!config.get_bool("volctl.cli.requireRoot"), "requireRoot default");
  ok &= ctx.expect(config.get_duration("storage.client.timeout") == std::chrono::seconds(30), "timeout default");
  ok &= ctx.expect(config.source("volctl.logLevel") == ConfigTier::Default, "default tier");
  return ok;
}

bool test_higher_tier_wins(TestContext& ctx) {
  ConfigStore config;
  std::string error;
  bool ok = true;
  ok &= config.set("volctl.logLevel", "info", ConfigTier::File, error);
  ok &= ctx.expect(config.get_string("volctl.logLevel") == "info", "file beats default");
  ok &= config.set("volctl.logLevel", "error", ConfigTier::Env, error);
  ok &= ctx.expect(config.get_string("volctl.logLevel") == "error", "env beats file");
  ok &= config.set("volctl.logLevel", "debug", ConfigTier::Flag, error);
  ok &= ctx.expect(config.get_string("volctl.logLevel") == "debug", "flag beats env");
  ok &= config.set("volctl.logLevel", "trace", ConfigTier::Override, error);
  ok &= ctx.expect(config.get_string("volctl.logLevel") == "debug", "override never beats flag");
  ok &= ctx.expect(config.source("volctl.logLevel") == ConfigTier::Flag, "flag is the source");

  config.clear_tier(ConfigTier::Flag);
  ok &= ctx.expect(config.get_string("volctl.logLevel") == "trace", "override beats env");
  return ok;
}

bool test_environment_names(TestContext& ctx) {
  ConfigStore config;
  FakeEnvironment env;
  env.set("VOLCTL_CONFIG_FILE", "/etc/volctl/config.json");
  env.set("VOLCTL_LOGLEVEL", "info");
  env.set("VOLCTL_CLI_REQUIREROOT", "yes");
  env.set("STORAGE_CLIENT_TIMEOUT", "1m30s");
  env.set("VOLCTL_CLI_TEMPLATETABS", "maybe");

  std::vector<std::string> warnings;
  config.load_environment(env.lookup(), warnings);

  ConfigStore overflowing;
  FakeEnvironment huge;
  huge.set("STORAGE_CLIENT_TIMEOUT", "9999999999999h");
  std::vector<std::string> huge_warnings;
  overflowing.load_environment(huge.lookup(), huge_warnings);

  bool ok = true;
  ok &= ctx.expect(config.get_string("volctl.configFile") == "/etc/volctl/config.json", "explicit env name");
  ok &= ctx.expect(config.get_string("volctl.logLevel") == "info", "derived env name");
  ok &= ctx.expect(config.get_bool("volctl.cli.requireRoot"), "bool from env");
  ok &= ctx.expect(config.get_duration("storage.client.timeout") == std::chrono::seconds(90), "duration from env");
  ok &= ctx.expect(config.get_bool("volctl.cli.templateTabs"), "bad value leaves default");
  ok &= ctx.expect(warnings.size() == 1 && contains(warnings[0], "VOLCTL_CLI_TEMPLATETABS"), "bad value warned");
  ok &= ctx.expect(huge_warnings.size() == 1 && contains(huge_warnings[0], "STORAGE_CLIENT_TIMEOUT"), "overflowing timeout warned");
  ok &= ctx.expect(overflowing.get_duration("storage.client.timeout") == std::chrono::seconds(30), "overflowing timeout keeps default");
  return ok;
}

bool test_nested_file_flattens(TestContext& ctx) {
  TempDir dir("nested");
  const auto path = dir.write_json("config.json", {
    {"volctl", {
      {"logLevel", "debug"},
      {"service", {{"listen", "127.0.0.1:9000"}}},
      {"cli", {{"templateTabs", false}}},
    }},
    {"storage.client.timeout", "5s"},
    {"custom", {{"key", 7}}},
  });

  ConfigStore config;
  std::string error;
  bool ok = ctx.expect(config.read_file(path, error), "read_file: " + error);
  ok &= ctx.expect(config.get_string("volctl.logLevel") == "debug", "nested key");
  ok &= ctx.expect(config.get_string("volctl.service.listen") == "127.0.0.1:9000", "deeply nested key");
  ok &= ctx.expect(!config.get_bool("volctl.cli.templateTabs"), "nested bool");
  ok &= ctx.expect(config.get_duration("storage.client.timeout") == std::chrono::seconds(5), "dotted key");
  ok &= ctx.expect(config.get_int("custom.key") == 7, "unknown key kept raw");
  ok &= ctx.expect(config.source("volctl.logLevel") == ConfigTier::File, "file tier");
  return ok;
}

bool test_bad_document_leaves_tier_untouched(TestContext& ctx) {
  ConfigStore config;
  std::string error;
  const nlohmann::json doc = {
    {"volctl.logLevel", "info"},
    {"volctl.cli.requireRoot", "sometimes"},
  };
  bool ok = ctx.expect(!config.merge_document(doc, ConfigTier::File, error), "bad bool rejected");
  ok &= ctx.expect(contains(error, "volctl.cli.requireRoot"), "error names the key");
  ok &= ctx.expect(config.get_string("volctl.logLevel") == "warn", "staged value discarded");

  error.clear();
  ok &= ctx.expect(!config.merge_document({{"storage.client.timeout", "9999999999999h"}}, ConfigTier::File, error),
                   "overflowing duration rejected");
  ok &= ctx.expect(contains(error, "out of range"), "overflow reported as a document error");
  ok &= ctx.expect(!config.merge_document({{"storage.client.timeout", -5}}, ConfigTier::File, error),
                   "negative duration rejected");
  ok &= ctx.expect(config.get_duration("storage.client.timeout") == std::chrono::seconds(30), "default kept");
  return ok;
}

bool test_durations(TestContext& ctx) {
  std::chrono::milliseconds value{0};
  std::string error;
  bool ok = true;
  ok &= ctx.expect(parse_duration("250ms", value, error) && value.count() == 250, "ms");
  ok &= ctx.expect(parse_duration("1h2m3s", value, error) && value.count() == 3723000, "compound");
  ok &= ctx.expect(parse_duration("45", value, error) && value.count() == 45000, "bare seconds");
  ok &= ctx.expect(!parse_duration("10 parsecs", value, error), "bad unit");

  value = std::chrono::milliseconds(7);
  ok &= ctx.expect(!parse_duration("99999999999999999999s", value, error), "too many digits rejected");
  ok &= ctx.expect(contains(error, "out of range"), "too many digits reported");
  ok &= ctx.expect(!parse_duration("9999999999999h", value, error), "hours overflow rejected");
  ok &= ctx.expect(!parse_duration("9223372036854775807", value, error), "bare seconds overflow rejected");
  ok &= ctx.expect(!parse_duration("9223372036854775807ms1ms", value, error), "sum overflow rejected");
  ok &= ctx.expect(value.count() == 7, "rejected input leaves value untouched");
  ok &= ctx.expect(format_duration(std::chrono::milliseconds(90000)) == "1m30s", "format");
  return ok;
}

bool test_validator(TestContext& ctx) {
  TempDir dir("validator");
  ConfigStore config;
  JsonConfigValidator validator;
  std::vector<std::string> warnings;
  std::string error;

  bool ok = true;
  const auto good = dir.write_json("good.json", {{"volctl", {{"logLevel", "info"}}}, {"other", 1}});
  ok &= ctx.expect(validator.validate(good, config, warnings, error), "good file: " + error);
  ok &= ctx.expect(warnings.size() == 1 && contains(warnings[0], "other"), "unknown key warned");

  const auto broken = dir.write("broken.json", "{ \"volctl\": ");
  ok &= ctx.expect(!validator.validate(broken, config, warnings, error), "broken json rejected");
  ok &= ctx.expect(contains(error, "not valid JSON"), "broken json message");

  const auto array = dir.write("array.json", "[1, 2]");
  ok &= ctx.expect(!validator.validate(array, config, warnings, error), "array rejected");

  const auto wrong = dir.write_json("wrong.json", {{"volctl.cli.requireRoot", nlohmann::json::array()}});
  ok &= ctx.expect(!validator.validate(wrong, config, warnings, error), "wrong type rejected");
  ok &= ctx.expect(contains(error, "volctl.cli.requireRoot"), "wrong type names key");
  return ok;
}

} // namespace

std::vector<TestCase> config_store_tests() {
  return {
    {"config_defaults", test_defaults_from_specification},
    {"config_tier_precedence", test_higher_tier_wins},
    {"config_environment", test_environment_names},
    {"config_nested_file", test_nested_file_flattens},
    {"config_bad_document", test_bad_document_leaves_tier_untouched},
    {"config_durations", test_durations},
    {"config_validator", test_validator},
  };
}

} // namespace volctl::test
