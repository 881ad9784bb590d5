#pragma once

#include <functional>
#include <stdexcept>
#include <string>

#include "control_signal.hpp"
#include "error_presenter.hpp"

struct InvocationState;
class ClientActivator;
class ConfigValidator;
class PermissionGate;

enum class LifecycleStep {
  LoadConfig,
  ApplyLogLevel,
  ApplyOverrides,
  HelpShortCircuit,
  CheckPermissions,
  ActivateClient,
};

const char* lifecycle_step_name(LifecycleStep step);

// A config file that exists but cannot be validated or read. Not recoverable.
class ConfigLoadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Setup every command goes through before its action runs. Steps run in
// declaration order and the first one to return a signal ends the pipeline.
class Lifecycle {
public:
  using StepObserver = std::function<void(LifecycleStep step)>;
  using EnvPublisher = std::function<void(const std::string& name, const std::string& value)>;

  struct Collaborators {
    const ConfigValidator* validator = nullptr;
    const PermissionGate* gate = nullptr;
    ClientActivator* activator = nullptr;
    StepObserver observer;
    EnvPublisher publish_env;
  };

  explicit Lifecycle(Collaborators collaborators);

  SignalResult run(InvocationState& state) const;

  SignalResult load_config(InvocationState& state) const;
  SignalResult apply_log_level(InvocationState& state) const;
  SignalResult apply_overrides(InvocationState& state) const;
  SignalResult help_short_circuit(InvocationState& state) const;
  SignalResult check_permissions(InvocationState& state) const;
  SignalResult activate_client(InvocationState& state) const;

  static void publish_process_env(const std::string& name, const std::string& value);

private:
  // Error report, a blank line, then the command's help.
  void report(InvocationState& state, const std::string& message) const;

  Collaborators collaborators_;
  ErrorPresenter presenter_;
};
