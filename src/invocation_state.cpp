#include "invocation_state.hpp"

#include "command_tree.hpp"
#include "storage_client.hpp"
#include "storage_service.hpp"

InvocationState::InvocationState()
  : logger(std::make_shared<Logger>("volctl")) {}

// Out of line so the unique_ptr members see complete types.
InvocationState::~InvocationState() = default;

bool bind_flags_to_config(const CommandNode& node,
                          const ParsedFlags& flags,
                          ConfigStore& config,
                          std::string& error) {
  config.clear_tier(ConfigTier::Flag);
  for(const auto* spec : node.visible_flags()) {
    if(spec->config_key.empty() || !flags.changed(spec->name)) continue;
    if(!config.set(spec->config_key, flags.value(spec->name), ConfigTier::Flag, error)) {
      error = "--" + spec->name + ": " + error;
      return false;
    }
  }
  return true;
}
