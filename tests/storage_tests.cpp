#include "commands.hpp"
#include "invocation_state.hpp"
#include "protocol.hpp"
#include "runner.hpp"
#include "storage_client.hpp"
#include "storage_service.hpp"
#include "test_runner_utils.hpp"

#include <thread>

namespace volctl::test {
namespace {

using namespace std::chrono_literals;

struct CliRun {
  std::ostringstream out;
  std::ostringstream err;
  FakeEnvironment env;
  std::shared_ptr<Logger> logger = std::make_shared<Logger>("volctl-test");
  std::function<void(const InvocationState&)> inspect;

  int run(const std::vector<std::string>& args) {
    auto tree = make_command_tree();
    Runner::Options options;
    options.out = &out;
    options.err = &err;
    options.terminal = false;
    options.env = env.lookup();
    options.publish_env = [](const std::string&, const std::string&){};
    options.logger = logger;
    options.on_finish = inspect;
    Runner runner(*tree, options);
    return runner.execute(args);
  }
};

bool test_service_and_client_exchange(TestContext& ctx) {
  auto errors = std::make_shared<ErrorStream>();
  auto logger = std::make_shared<Logger>("service-test");
  ctx.logs.attach(logger, "service");
  LocalStorageService service({"unit", "127.0.0.1:0"}, errors, logger);

  std::string error;
  bool ok = ctx.expect(service.start(error), "start: " + error);
  if(!ok) return false;
  service.start_background();
  ok &= ctx.expect(service.port() != 0, "ephemeral port assigned");

  StorageClient client(service.address(), 5s, logger);
  ok &= ctx.expect(client.connect("unit", error), "connect: " + error);
  ok &= ctx.expect(client.service() == "unit", "handshake names the service");

  auto types = client.request("module.types", nlohmann::json::object(), false, error);
  ok &= ctx.expect(types && types->at("result").is_array() &&
                   types->at("result").at(0).value("name", "") == "storage", "module types");

  auto volumes = client.request("volume.list", nlohmann::json::object(), false, error);
  ok &= ctx.expect(volumes && volumes->at("result") == nlohmann::json::array(), "no volumes");

  auto create = client.request("volume.create", {{"name", "data"}}, false, error);
  ok &= ctx.expect(!create && contains(error, "no storage driver"), "create fails: " + error);

  auto accepted = client.request("volume.attach", {{"volumeID", "vol-1"}}, true, error);
  ok &= ctx.expect(accepted && accepted->value("type", "") == "accepted", "async request accepted");

  client.close();
  service.stop();
  ok &= ctx.expect(errors->closed(), "stream closed by stop");
  const auto failures = errors->drain();
  ok &= ctx.expect(failures.size() == 1 && contains(failures[0], "volume.attach"), "async failure reported");
  return ok;
}

bool test_closed_sessions_are_pruned(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("service-test");
  ctx.logs.attach(logger, "service");
  LocalStorageService service({"unit", "127.0.0.1:0"}, nullptr, logger);
  std::string error;
  if(!ctx.expect(service.start(error), "start: " + error)) return false;
  service.start_background();

  constexpr std::size_t kConnections = 20;
  bool ok = true;
  for(std::size_t i = 0; i < kConnections; ++i) {
    StorageClient client(service.address(), 5s, logger);
    ok &= ctx.expect(client.connect("unit", error), "connect: " + error);
    client.close();
    // Give the service a moment to see the disconnect before the next accept.
    std::this_thread::sleep_for(20ms);
  }
  ok &= ctx.expect(service.tracked_sessions() < kConnections / 2,
                   "closed sessions dropped, tracking " + std::to_string(service.tracked_sessions()));
  service.stop();
  ok &= ctx.expect(service.tracked_sessions() == 0, "stop forgets every session");
  return ok;
}

bool test_service_rejects_malformed_messages(TestContext& ctx) {
  LocalStorageService service({}, nullptr, nullptr);
  auto reply = service.handle_message({{"type", "gossip"}});
  bool ok = ctx.expect(reply.value("type", "") == "error", "unknown type rejected");
  reply = service.handle_message({{"type", "request"}});
  ok &= ctx.expect(reply.value("type", "") == "error", "request without op rejected");
  reply = service.handle_message(make_request("volume.path", {{"volumeID", "vol-9"}}, false));
  ok &= ctx.expect(contains(reply.value("message", ""), "vol-9"), "volume path not found");
  return ok;
}

bool test_address_parsing(TestContext& ctx) {
  std::string host;
  unsigned short port = 0;
  std::string error;
  bool ok = true;
  ok &= ctx.expect(parse_service_address("tcp://127.0.0.1:7979", host, port, error) &&
                   host == "127.0.0.1" && port == 7979, "tcp scheme");
  ok &= ctx.expect(parse_service_address("localhost:80", host, port, error) && host == "localhost", "bare host");
  ok &= ctx.expect(!parse_service_address("unix:///run/volctl.sock", host, port, error), "unix rejected");
  ok &= ctx.expect(!parse_service_address("127.0.0.1:99999", host, port, error), "port range");
  ok &= ctx.expect(!parse_service_address("127.0.0.1", host, port, error), "missing port");
  return ok;
}

bool test_embedded_activation(TestContext& ctx) {
  CliRun cli;
  std::string storage_host;
  bool activated = false;
  cli.inspect = [&](const InvocationState& state){
    storage_host = state.config.get_string("storage.host");
    activated = state.client_activated;
  };
  const int code = cli.run({"module", "types", "--format", "json"});
  bool ok = ctx.expect(code == 0, "exit code " + std::to_string(code) + "\n" + cli.err.str());
  ok &= ctx.expect(activated, "client activated");
  ok &= ctx.expect(storage_host.rfind("tcp://127.0.0.1:", 0) == 0, "embedded address " + storage_host);
  const auto types = nlohmann::json::parse(cli.out.str(), nullptr, false);
  ok &= ctx.expect(types.is_array() && !types.empty() && types[0].value("name", "") == "storage",
                   "module types printed: " + cli.out.str());
  return ok;
}

bool test_activation_failure(TestContext& ctx) {
  CliRun cli;
  cli.env.set("STORAGE_CLIENT_TIMEOUT", "2s");
  const int code = cli.run({"--host", "tcp://127.0.0.1:1", "volume", "ls"});
  bool ok = ctx.expect(code == 1, "exit code " + std::to_string(code));
  ok &= ctx.expect(contains(cli.err.str(), "127.0.0.1:1"), "error names the host: " + cli.err.str());
  ok &= ctx.expect(contains(cli.out.str(), "List volumes"), "help follows the error");
  return ok;
}

bool test_list_renders_table(TestContext& ctx) {
  CliRun cli;
  const int code = cli.run({"volume", "ls"});
  bool ok = ctx.expect(code == 0, "exit code " + std::to_string(code) + "\n" + cli.err.str());
  ok &= ctx.expect(cli.out.str() == "ID  NAME  SIZE  STATUS\n", "header only: " + cli.out.str());

  CliRun quiet;
  quiet.run({"volume", "ls", "-q"});
  ok &= ctx.expect(quiet.out.str().empty(), "quiet drops the header: " + quiet.out.str());
  return ok;
}

bool test_mutation_errors(TestContext& ctx) {
  CliRun single;
  int code = single.run({"volume", "create", "data", "logs"});
  bool ok = ctx.expect(code == 1, "exit code " + std::to_string(code));
  const auto first = single.err.str();
  ok &= ctx.expect(contains(first, "no storage driver to perform volume.create"), "error rendered: " + first);
  ok &= ctx.expect(first.find("Oops") == first.rfind("Oops"), "stops at the first failure");

  CliRun tolerant;
  code = tolerant.run({"volume", "create", "--continueOnError", "data", "logs"});
  ok &= ctx.expect(code == 1, "continueOnError still fails overall");
  const auto both = tolerant.err.str();
  ok &= ctx.expect(both.find("Oops") != both.rfind("Oops"), "both failures rendered");

  CliRun missing;
  code = missing.run({"volume", "rm"});
  ok &= ctx.expect(code == 1 && contains(missing.err.str(), "at least one argument"), "target required");
  return ok;
}

bool test_dry_run(TestContext& ctx) {
  CliRun cli;
  const int code = cli.run({"volume", "rm", "-n", "--force", "vol-1"});
  bool ok = ctx.expect(code == 0, "exit code " + std::to_string(code) + "\n" + cli.err.str());
  ok &= ctx.expect(contains(cli.out.str(), "would volume.remove "), "dry run printed: " + cli.out.str());
  ok &= ctx.expect(contains(cli.out.str(), "\"volumeID\":\"vol-1\""), "target in request");
  ok &= ctx.expect(contains(cli.out.str(), "\"force\":true"), "flag in request");
  return ok;
}

bool test_async_failure_logged_at_exit(TestContext& ctx) {
  CliRun cli;
  ctx.logs.attach(cli.logger, "cli");
  const int code = cli.run({"volume", "attach", "--async", "vol-1"});
  bool ok = ctx.expect(code == 0, "exit code " + std::to_string(code) + "\n" + cli.err.str());
  ok &= ctx.expect(contains(cli.out.str(), "volume.attach: accepted by default"),
                   "accepted printed with the activated service: " + cli.out.str());
  ok &= ctx.expect(ctx.logs.contains("asynchronous operation failed"), "failure drained");
  return ok;
}

bool test_informational_commands(TestContext& ctx) {
  bool ok = true;
  CliRun version;
  ok &= ctx.expect(version.run({"version"}) == 0, "version exit");
  ok &= ctx.expect(contains(version.out.str(), "Version:"), "version printed");

  CliRun help;
  ok &= ctx.expect(help.run({"help", "volume"}) == 0, "help topic exit");
  ok &= ctx.expect(contains(help.out.str(), "Usage:\n  volctl volume [command]"), "help topic printed");

  CliRun bogus;
  ok &= ctx.expect(bogus.run({"help", "bogus"}) == 1, "unknown topic fails");
  ok &= ctx.expect(contains(bogus.err.str(), "unknown help topic \"bogus\""), "unknown topic message");
  return ok;
}

bool test_service_status_and_install(TestContext& ctx) {
  TempDir dir("service");
  const auto pid_file = dir.path() / "volctl.pid";
  const auto unit_file = dir.path() / "volctl.service";

  CliRun status;
  status.env.set("VOLCTL_SERVICE_PIDFILE", pid_file.string());
  bool ok = ctx.expect(status.run({"service", "status"}) == 3, "not running exits 3");
  ok &= ctx.expect(contains(status.out.str(), "not running"), "status printed");

  CliRun dry;
  dry.env.set("VOLCTL_SERVICE_UNITFILE", unit_file.string());
  ok &= ctx.expect(dry.run({"install", "--dryRun"}) == 0, "dry install exit");
  ok &= ctx.expect(contains(dry.out.str(), "ExecStart="), "unit shown");
  ok &= ctx.expect(!std::filesystem::exists(unit_file), "dry run writes nothing");

  CliRun install;
  install.env.set("VOLCTL_SERVICE_UNITFILE", unit_file.string());
  ok &= ctx.expect(install.run({"install"}) == 0, "install exit: " + install.err.str());
  ok &= ctx.expect(std::filesystem::exists(unit_file), "unit written");

  CliRun uninstall;
  uninstall.env.set("VOLCTL_SERVICE_UNITFILE", unit_file.string());
  ok &= ctx.expect(uninstall.run({"uninstall"}) == 0, "uninstall exit");
  ok &= ctx.expect(!std::filesystem::exists(unit_file), "unit removed");
  return ok;
}

} // namespace

std::vector<TestCase> storage_tests() {
  return {
    {"storage_service_client_exchange", test_service_and_client_exchange},
    {"storage_service_prunes_sessions", test_closed_sessions_are_pruned},
    {"storage_service_malformed", test_service_rejects_malformed_messages},
    {"storage_address_parsing", test_address_parsing},
    {"storage_embedded_activation", test_embedded_activation},
    {"storage_activation_failure", test_activation_failure},
    {"storage_list_table", test_list_renders_table},
    {"storage_mutation_errors", test_mutation_errors},
    {"storage_dry_run", test_dry_run},
    {"storage_async_failure", test_async_failure_logged_at_exit},
    {"cli_informational_commands", test_informational_commands},
    {"cli_service_status_and_install", test_service_status_and_install},
  };
}

} // namespace volctl::test
