#include "lifecycle.hpp"

#include <cstdlib>
#include <filesystem>
#include <utility>
#include <vector>

#include "client_activator.hpp"
#include "command_tree.hpp"
#include "config_validator.hpp"
#include "invocation_state.hpp"
#include "permission_gate.hpp"

const char* lifecycle_step_name(LifecycleStep step) {
  switch(step) {
    case LifecycleStep::LoadConfig: return "load-config";
    case LifecycleStep::ApplyLogLevel: return "apply-log-level";
    case LifecycleStep::ApplyOverrides: return "apply-overrides";
    case LifecycleStep::HelpShortCircuit: return "help-short-circuit";
    case LifecycleStep::CheckPermissions: return "check-permissions";
    case LifecycleStep::ActivateClient: return "activate-client";
  }
  return "unknown";
}

Lifecycle::Lifecycle(Collaborators collaborators)
  : collaborators_(std::move(collaborators)) {
  if(!collaborators_.publish_env) {
    collaborators_.publish_env = &Lifecycle::publish_process_env;
  }
}

void Lifecycle::publish_process_env(const std::string& name, const std::string& value) {
  ::setenv(name.c_str(), value.c_str(), 1);
}

SignalResult Lifecycle::run(InvocationState& state) const {
  using Step = SignalResult (Lifecycle::*)(InvocationState&) const;
  static const std::pair<LifecycleStep, Step> steps[] = {
    {LifecycleStep::LoadConfig, &Lifecycle::load_config},
    {LifecycleStep::ApplyLogLevel, &Lifecycle::apply_log_level},
    {LifecycleStep::ApplyOverrides, &Lifecycle::apply_overrides},
    {LifecycleStep::HelpShortCircuit, &Lifecycle::help_short_circuit},
    {LifecycleStep::CheckPermissions, &Lifecycle::check_permissions},
    {LifecycleStep::ActivateClient, &Lifecycle::activate_client},
  };

  for(const auto& [step, fn] : steps) {
    if(collaborators_.observer) collaborators_.observer(step);
    state.logger->trace("lifecycle step {}", lifecycle_step_name(step));
    if(auto signal = (this->*fn)(state)) {
      state.logger->debug("lifecycle stopped at {}: {}", lifecycle_step_name(step), describe(*signal));
      return signal;
    }
  }
  return std::nullopt;
}

SignalResult Lifecycle::load_config(InvocationState& state) const {
  const auto path_text = state.config.get_string("volctl.configFile");
  if(path_text.empty()) return std::nullopt;

  const std::filesystem::path path(path_text);
  std::error_code ec;
  if(!std::filesystem::exists(path, ec)) {
    state.logger->debug("config file {} does not exist, skipping", path_text);
    return std::nullopt;
  }

  std::string error;
  if(collaborators_.validator) {
    std::vector<std::string> warnings;
    if(!collaborators_.validator->validate(path, state.config, warnings, error)) {
      throw ConfigLoadError("invalid config file " + path_text + ": " + error);
    }
    for(const auto& warning : warnings) {
      state.logger->warn("{}", warning);
    }
  }
  if(!state.config.read_file(path, error)) {
    throw ConfigLoadError("unable to load config file " + path_text + ": " + error);
  }
  collaborators_.publish_env("VOLCTL_CONFIG_FILE", path_text);
  state.logger->debug("loaded config file {}", path_text);

  // Flags given on the command line must still beat the file.
  if(state.tree && state.node) {
    if(!state.tree->parse_flags(*state.node, state.flag_tokens, state.flags, state.args, error) ||
       !bind_flags_to_config(*state.node, state.flags, state.config, error)) {
      presenter_.render(error, state.is_terminal, *state.err);
      state.tree->render_usage(*state.node, *state.out);
      return ReportedError{};
    }
  }
  return std::nullopt;
}

SignalResult Lifecycle::apply_log_level(InvocationState& state) const {
  const auto text = state.config.get_string("volctl.logLevel");
  const auto level = parse_log_level(text);
  if(!level) {
    state.logger->debug("ignoring unrecognised log level '{}'", text);
    return std::nullopt;
  }
  state.logger->set_level(*level);
  std::string error;
  if(!state.config.set("volctl.logLevel", log_level_name(*level), ConfigTier::Override, error)) {
    state.logger->warn("unable to persist log level: {}", error);
  }
  state.context.set_log_level(*level);
  return std::nullopt;
}

SignalResult Lifecycle::apply_overrides(InvocationState& state) const {
  std::string error;
  auto set_override = [&](const std::string& key, const nlohmann::json& value){
    if(!state.config.set(key, value, ConfigTier::Override, error)) {
      state.logger->warn("unable to override {}: {}", key, error);
    }
  };

  set_override("volctl.integration.volume.operations.path.cache.enabled", false);

  const auto host = state.config.get_string("volctl.host");
  if(!host.empty()) set_override("storage.host", host);
  const auto service = state.config.get_string("volctl.service");
  if(!service.empty()) set_override("storage.service", service);
  return std::nullopt;
}

SignalResult Lifecycle::help_short_circuit(InvocationState& state) const {
  if(!state.flags.get_bool("help") && !state.flags.get_bool("verbose")) {
    return std::nullopt;
  }
  if(state.tree && state.node) {
    state.tree->render_help(*state.node, *state.out);
  }
  return HelpRequested{};
}

SignalResult Lifecycle::check_permissions(InvocationState& state) const {
  if(!collaborators_.gate || !state.node) return std::nullopt;
  const auto denial = collaborators_.gate->check(*state.node, state.config);
  if(!denial) return std::nullopt;
  report(state, *denial);
  return ReportedError{};
}

SignalResult Lifecycle::activate_client(InvocationState& state) const {
  if(!state.node || !state.node->activate_client()) return std::nullopt;
  if(state.node->has_flag("async") && state.flags.get_bool("async")) {
    state.context.set("async", true);
  }
  if(!collaborators_.activator) {
    report(state, "no storage client is available");
    return ReportedError{};
  }
  std::string error;
  if(!collaborators_.activator->activate(state, error)) {
    report(state, error);
    return ReportedError{};
  }
  return std::nullopt;
}

void Lifecycle::report(InvocationState& state, const std::string& message) const {
  presenter_.render(message, state.is_terminal, *state.err);
  *state.err << "\n";
  state.err->flush();
  if(state.tree && state.node) {
    state.tree->render_help(*state.node, *state.out);
  }
}
