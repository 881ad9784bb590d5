#include "permission_gate.hpp"

#include <unistd.h>

#include <array>
#include <utility>

#include "command_tree.hpp"
#include "config_store.hpp"

namespace {

unsigned int process_euid() {
  return static_cast<unsigned int>(::geteuid());
}

} // namespace

std::optional<std::string> privileged_operation(const CommandNode& node) {
  static const std::array<std::pair<const char*, const char*>, 5> operations = {{
    {"install", "installed"},
    {"uninstall", "uninstalled"},
    {"service start", "started"},
    {"service stop", "stopped"},
    {"service restart", "restarted"},
  }};
  const auto identity = node.identity();
  for(const auto& [command, participle] : operations) {
    if(identity == command) return std::string(participle);
  }
  return std::nullopt;
}

DefaultPermissionGate::DefaultPermissionGate()
  : effective_uid_(&process_euid) {}

DefaultPermissionGate::DefaultPermissionGate(unsigned int (*effective_uid)())
  : effective_uid_(effective_uid ? effective_uid : &process_euid) {}

std::optional<std::string> DefaultPermissionGate::check(const CommandNode& node,
                                                        const ConfigStore& config) const {
  if(!config.get_bool("volctl.cli.requireRoot")) return std::nullopt;
  const auto operation = privileged_operation(node);
  if(!operation) return std::nullopt;
  if(effective_uid_() == 0) return std::nullopt;
  return "volctl can only be " + *operation + " by root";
}
