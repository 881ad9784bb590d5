#pragma once

#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <cpptrace/cpptrace.hpp>

#include "client_activator.hpp"
#include "command_tree.hpp"
#include "config_store.hpp"
#include "config_validator.hpp"
#include "lifecycle.hpp"
#include "log.hpp"
#include "permission_gate.hpp"

// Top of every invocation: resolves argv, runs the lifecycle and the action,
// and turns the resulting signal into the process exit code. Faults are
// logged with a stack trace and rethrown.
class Runner {
public:
  struct Options {
    std::ostream* out = &std::cout;
    std::ostream* err = &std::cerr;
    std::optional<bool> terminal;                 // probed from stderr when unset
    std::shared_ptr<const PermissionGate> gate;
    std::shared_ptr<ClientActivator> activator;
    std::shared_ptr<const ConfigValidator> validator;
    ConfigStore::EnvLookup env;                   // process environment when unset
    Lifecycle::EnvPublisher publish_env;
    Lifecycle::StepObserver observer;
    std::shared_ptr<Logger> logger;
    std::function<void(const InvocationState&)> on_finish;
  };

  Runner(const CommandTree& tree, Options options);

  int execute(const std::vector<std::string>& args);

private:
  SignalResult dispatch(InvocationState& state, const std::vector<std::string>& args);
  void finish(InvocationState& state) const;
  void report_fault(InvocationState& state,
                    const std::exception& e,
                    const cpptrace::stacktrace& trace) const;

  const CommandTree& tree_;
  Options options_;
};
