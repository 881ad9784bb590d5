#pragma once

#include <memory>
#include <string>
#include <vector>

#include "command_tree.hpp"

#ifndef VOLCTL_VERSION
#define VOLCTL_VERSION "0.0.0"
#endif

// A storage operation forwarded to the service: one request, or one per
// positional target when `target_key` is set and `multi_target` is true.
struct StorageOperation {
  std::string op;
  std::string target_key;
  bool multi_target = false;
  bool requires_target = false;
  std::vector<std::string> columns;
  std::vector<std::string> arg_flags;   // flag values copied into the request args
};

CommandAction storage_action(StorageOperation operation);

void add_root_flags(CommandNode& root);
void register_commands(CommandTree& tree);
void register_service_commands(CommandTree& tree);

// The full volctl command hierarchy.
std::unique_ptr<CommandTree> make_command_tree();
