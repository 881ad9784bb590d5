#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "control_signal.hpp"
#include "flag_set.hpp"

struct InvocationState;

using CommandAction = std::function<SignalResult(InvocationState& state,
                                                 const std::vector<std::string>& args)>;

struct CommandSpec {
  std::string name;
  std::string short_desc;
  std::string long_desc;
  std::string args_usage;            // e.g. "[volumeID...]"
  std::vector<FlagSpec> flags;
  CommandAction action;
  bool run_lifecycle = true;
  bool activate_client = false;
};

class CommandNode {
public:
  CommandNode(CommandSpec spec, CommandNode* parent);

  const std::string& name() const { return spec_.name; }
  const std::string& short_desc() const { return spec_.short_desc; }
  const std::string& long_desc() const { return spec_.long_desc; }
  const std::string& args_usage() const { return spec_.args_usage; }
  const CommandAction& action() const { return spec_.action; }
  bool run_lifecycle() const { return spec_.run_lifecycle; }
  bool activate_client() const { return spec_.activate_client; }

  CommandNode* parent() const { return parent_; }
  bool is_root() const { return parent_ == nullptr; }
  const std::vector<std::unique_ptr<CommandNode>>& children() const { return children_; }
  CommandNode* find_child(const std::string& name) const;

  // Names from the root, excluding the root itself: {"service", "start"}.
  std::vector<std::string> path() const;
  // Identity used by policy code: "service start". Empty for the root.
  std::string identity() const;
  // Full invocation prefix: "volctl service start".
  std::string command_path() const;

  const std::vector<FlagSpec>& local_flags() const { return spec_.flags; }
  std::vector<const FlagSpec*> inherited_flags() const;
  std::vector<const FlagSpec*> visible_flags() const;
  bool has_flag(const std::string& name) const;
  void add_flag(FlagSpec flag);

  CommandNode& adopt(std::unique_ptr<CommandNode> child);

private:
  CommandSpec spec_;
  CommandNode* parent_ = nullptr;
  std::vector<std::unique_ptr<CommandNode>> children_;
};

struct Resolution {
  CommandNode* node = nullptr;
  std::vector<std::string> args;          // positional tokens for the action
  std::vector<std::string> flag_tokens;   // every token that was not a command name
  ParsedFlags flags;
  std::string error;                      // set when the flags did not parse
};

// Registry and argv resolver. The lifecycle and the runner only talk to this
// interface so the parser behind it can be replaced.
class CommandTree {
public:
  virtual ~CommandTree() = default;

  virtual CommandNode& root() = 0;
  virtual const CommandNode& root() const = 0;

  virtual CommandNode& add_command(const std::vector<std::string>& parent_path, CommandSpec spec) = 0;
  virtual CommandNode* find(const std::vector<std::string>& path) const = 0;

  virtual Resolution resolve(const std::vector<std::string>& args) const = 0;
  virtual bool parse_flags(const CommandNode& node,
                           const std::vector<std::string>& tokens,
                           ParsedFlags& out,
                           std::vector<std::string>& positional,
                           std::string& error) const = 0;

  virtual void render_help(const CommandNode& node, std::ostream& out) const = 0;
  virtual void render_usage(const CommandNode& node, std::ostream& out) const = 0;
};

class FlagCommandTree : public CommandTree {
public:
  FlagCommandTree(std::string program, std::string short_desc, std::string long_desc = {});

  CommandNode& root() override { return *root_; }
  const CommandNode& root() const override { return *root_; }

  CommandNode& add_command(const std::vector<std::string>& parent_path, CommandSpec spec) override;
  CommandNode* find(const std::vector<std::string>& path) const override;

  Resolution resolve(const std::vector<std::string>& args) const override;
  bool parse_flags(const CommandNode& node,
                   const std::vector<std::string>& tokens,
                   ParsedFlags& out,
                   std::vector<std::string>& positional,
                   std::string& error) const override;

  void render_help(const CommandNode& node, std::ostream& out) const override;
  void render_usage(const CommandNode& node, std::ostream& out) const override;

private:
  static std::string format_flags(const std::vector<const FlagSpec*>& flags);
  static std::string default_suffix(const FlagSpec& flag);

  std::unique_ptr<CommandNode> root_;
};

// Opt-in flag groups shared by commands that produce output or mutate state.
void add_output_format_flags(CommandNode& node);
void add_quiet_flag(CommandNode& node);
void add_dry_run_flag(CommandNode& node);
void add_continue_on_error_flag(CommandNode& node);
void add_idempotent_flag(CommandNode& node);
void add_async_flag(CommandNode& node);
