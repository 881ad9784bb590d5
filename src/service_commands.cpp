#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <thread>

#include "commands.hpp"
#include "error_presenter.hpp"
#include "invocation_state.hpp"
#include "storage_service.hpp"

namespace fs = std::filesystem;

namespace {

constexpr auto kStopTimeout = std::chrono::seconds(10);
constexpr auto kStopPollInterval = std::chrono::milliseconds(100);

SignalResult fail(InvocationState& state, const std::string& message) {
  ErrorPresenter().render(message, state.is_terminal, *state.err);
  return ReportedError{};
}

std::optional<pid_t> read_pid_file(const fs::path& path) {
  std::ifstream in(path);
  if(!in) return std::nullopt;
  long long pid = 0;
  if(!(in >> pid) || pid <= 0) return std::nullopt;
  return static_cast<pid_t>(pid);
}

bool process_alive(pid_t pid) {
  return ::kill(pid, 0) == 0 || errno == EPERM;
}

std::optional<pid_t> running_pid(const InvocationState& state) {
  const auto pid = read_pid_file(state.config.get_string("volctl.service.pidFile"));
  if(!pid || !process_alive(*pid)) return std::nullopt;
  return pid;
}

std::string executable_path() {
  std::error_code ec;
  auto path = fs::read_symlink("/proc/self/exe", ec);
  if(ec) return "/usr/bin/volctl";
  return path.string();
}

std::string unit_file_contents(const InvocationState& state) {
  std::ostringstream unit;
  unit << "[Unit]\n"
       << "Description=volctl storage service\n"
       << "Before=docker.service\n"
       << "\n"
       << "[Service]\n"
       << "EnvironmentFile=-/etc/volctl/volctl.env\n"
       << "ExecStart=" << executable_path() << " service start";
  const auto config_file = state.config.get_string("volctl.configFile");
  if(!config_file.empty()) unit << " --config " << config_file;
  unit << "\n"
       << "ExecReload=/bin/kill -HUP $MAINPID\n"
       << "KillMode=process\n"
       << "\n"
       << "[Install]\n"
       << "WantedBy=docker.service\n";
  return unit.str();
}

SignalResult install(InvocationState& state, const std::vector<std::string>&) {
  const fs::path unit_path = state.config.get_string("volctl.service.unitFile");
  const auto contents = unit_file_contents(state);
  if(state.flags.get_bool("dryRun")) {
    *state.out << "would write " << unit_path.string() << ":\n" << contents;
    return std::nullopt;
  }

  std::error_code ec;
  if(unit_path.has_parent_path()) fs::create_directories(unit_path.parent_path(), ec);
  std::ofstream out(unit_path, std::ios::trunc);
  if(!out || !(out << contents)) {
    return fail(state, "unable to write " + unit_path.string());
  }
  state.logger->info("wrote {}", unit_path.string());
  *state.out << "installed " << unit_path.string() << "\n";
  return std::nullopt;
}

SignalResult uninstall(InvocationState& state, const std::vector<std::string>&) {
  const fs::path unit_path = state.config.get_string("volctl.service.unitFile");
  if(state.flags.get_bool("dryRun")) {
    *state.out << "would remove " << unit_path.string() << "\n";
    return std::nullopt;
  }
  std::error_code ec;
  if(!fs::remove(unit_path, ec)) {
    if(ec) return fail(state, "unable to remove " + unit_path.string() + ": " + ec.message());
    state.logger->info("{} is not installed", unit_path.string());
  }
  *state.out << "uninstalled " << unit_path.string() << "\n";
  return std::nullopt;
}

SignalResult start(InvocationState& state, const std::vector<std::string>&) {
  if(const auto pid = running_pid(state)) {
    return fail(state, "volctl is already running (pid " + std::to_string(*pid) + ")");
  }

  LocalStorageService::Options options;
  options.service_name = state.config.get_string("storage.service");
  options.listen_address = state.config.get_string("volctl.service.listen");
  auto errors = std::make_shared<ErrorStream>();
  LocalStorageService service(options, errors, state.logger);

  std::string error;
  if(!service.start(error)) {
    return fail(state, error);
  }

  const fs::path pid_path = state.config.get_string("volctl.service.pidFile");
  {
    std::ofstream pid_file(pid_path, std::ios::trunc);
    if(!pid_file || !(pid_file << ::getpid() << "\n")) {
      service.stop();
      return fail(state, "unable to write " + pid_path.string());
    }
  }

  *state.out << "volctl service '" << service.service_name() << "' listening on "
             << service.address() << "\n";
  state.out->flush();

  service.stop_on_signals();
  service.run();
  service.stop();

  std::error_code ec;
  fs::remove(pid_path, ec);
  for(const auto& failure : errors->drain()) {
    state.logger->error("{}", failure);
  }
  return std::nullopt;
}

SignalResult stop(InvocationState& state, const std::vector<std::string>&) {
  const auto pid = running_pid(state);
  if(!pid) {
    *state.out << "volctl is not running\n";
    return std::nullopt;
  }
  if(::kill(*pid, SIGTERM) != 0) {
    return fail(state, "unable to stop pid " + std::to_string(*pid) + ": " + std::strerror(errno));
  }

  const auto deadline = std::chrono::steady_clock::now() + kStopTimeout;
  while(process_alive(*pid)) {
    if(std::chrono::steady_clock::now() > deadline) {
      return fail(state, "pid " + std::to_string(*pid) + " did not exit within " +
                         format_duration(std::chrono::duration_cast<std::chrono::milliseconds>(kStopTimeout)));
    }
    std::this_thread::sleep_for(kStopPollInterval);
  }
  *state.out << "stopped volctl (pid " << *pid << ")\n";
  return std::nullopt;
}

SignalResult restart(InvocationState& state, const std::vector<std::string>& args) {
  if(auto signal = stop(state, args)) return signal;
  return start(state, args);
}

SignalResult status(InvocationState& state, const std::vector<std::string>&) {
  if(const auto pid = running_pid(state)) {
    *state.out << "volctl is running (pid " << *pid << ")\n";
    return std::nullopt;
  }
  *state.out << "volctl is not running\n";
  return ExitWithCode{3};
}

SignalResult initsys(InvocationState& state, const std::vector<std::string>&) {
  std::error_code ec;
  if(fs::is_directory("/run/systemd/system", ec)) {
    *state.out << "systemd\n";
  } else if(fs::exists("/usr/sbin/update-rc.d", ec)) {
    *state.out << "update-rc.d\n";
  } else if(fs::exists("/sbin/chkconfig", ec)) {
    *state.out << "chkconfig\n";
  } else {
    *state.out << "unknown\n";
  }
  return std::nullopt;
}

CommandSpec verb(std::string name, std::string short_desc, CommandAction action) {
  CommandSpec spec;
  spec.name = std::move(name);
  spec.short_desc = std::move(short_desc);
  spec.action = std::move(action);
  return spec;
}

} // namespace

void register_service_commands(CommandTree& tree) {
  auto& install_node = tree.add_command({}, verb("install", "Install the volctl systemd unit", &install));
  add_dry_run_flag(install_node);
  auto& uninstall_node = tree.add_command({}, verb("uninstall", "Remove the volctl systemd unit", &uninstall));
  add_dry_run_flag(uninstall_node);

  CommandSpec service;
  service.name = "service";
  service.short_desc = "The service controller";
  tree.add_command({}, std::move(service));

  tree.add_command({"service"}, verb("start", "Run the storage service in the foreground", &start));
  tree.add_command({"service"}, verb("stop", "Stop the running storage service", &stop));
  tree.add_command({"service"}, verb("restart", "Restart the storage service", &restart));
  tree.add_command({"service"}, verb("status", "Print the service status", &status));
  tree.add_command({"service"}, verb("initsys", "Print the detected init system", &initsys));
}
