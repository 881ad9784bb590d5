#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "config_store.hpp"
#include "error_stream.hpp"
#include "flag_set.hpp"
#include "log.hpp"
#include "request_context.hpp"

class CommandNode;
class CommandTree;
class LocalStorageService;
class StorageClient;

// Everything one run of the program owns. Created by the Runner, handed by
// reference to each lifecycle step and to the command action.
struct InvocationState {
  InvocationState();
  ~InvocationState();

  InvocationState(const InvocationState&) = delete;
  InvocationState& operator=(const InvocationState&) = delete;

  const CommandTree* tree = nullptr;
  CommandNode* node = nullptr;

  ParsedFlags flags;
  std::vector<std::string> flag_tokens;
  std::vector<std::string> args;

  ConfigStore config;
  std::shared_ptr<Logger> logger;
  RequestContext context;

  std::ostream* out = &std::cout;
  std::ostream* err = &std::cerr;
  bool is_terminal = false;

  bool client_activated = false;
  std::unique_ptr<StorageClient> client;
  std::unique_ptr<LocalStorageService> service;
  std::shared_ptr<ErrorStream> errors;
};

// Writes every changed flag that names a config key into the Flag tier,
// replacing whatever the tier held before.
bool bind_flags_to_config(const CommandNode& node,
                          const ParsedFlags& flags,
                          ConfigStore& config,
                          std::string& error);
