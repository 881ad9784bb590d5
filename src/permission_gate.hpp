#pragma once

#include <optional>
#include <string>

class CommandNode;
class ConfigStore;

// Past participle used in the denial message, or nullopt for commands that
// need no privilege: "service start" -> "started".
std::optional<std::string> privileged_operation(const CommandNode& node);

class PermissionGate {
public:
  virtual ~PermissionGate() = default;

  // nullopt permits the command; otherwise the message to show the user.
  virtual std::optional<std::string> check(const CommandNode& node, const ConfigStore& config) const = 0;
};

// Denies privileged commands to non-root users when volctl.cli.requireRoot is
// set. Everything is permitted otherwise.
class DefaultPermissionGate : public PermissionGate {
public:
  DefaultPermissionGate();
  explicit DefaultPermissionGate(unsigned int (*effective_uid)());

  std::optional<std::string> check(const CommandNode& node, const ConfigStore& config) const override;

private:
  unsigned int (*effective_uid_)();
};
