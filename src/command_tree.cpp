#include "command_tree.hpp"

#include <algorithm>
#include <cstddef>
#include <sstream>
#include <stdexcept>

#include "config_store.hpp"

namespace {

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for(std::size_t i = 0; i < parts.size(); ++i) {
    if(i > 0) out += sep;
    out += parts[i];
  }
  return out;
}

std::string pad_right(const std::string& text, std::size_t width) {
  if(text.size() >= width) return text;
  return text + std::string(width - text.size(), ' ');
}

} // namespace

// ---- CommandNode -----------------------------------------------------------

CommandNode::CommandNode(CommandSpec spec, CommandNode* parent)
  : spec_(std::move(spec)), parent_(parent) {}

CommandNode* CommandNode::find_child(const std::string& name) const {
  for(const auto& child : children_) {
    if(child->name() == name) return child.get();
  }
  return nullptr;
}

std::vector<std::string> CommandNode::path() const {
  std::vector<std::string> out;
  for(const CommandNode* at = this; at && !at->is_root(); at = at->parent_) {
    out.push_back(at->name());
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::string CommandNode::identity() const {
  return join(path(), " ");
}

std::string CommandNode::command_path() const {
  const CommandNode* root = this;
  while(root->parent_) root = root->parent_;
  auto names = path();
  names.insert(names.begin(), root->name());
  return join(names, " ");
}

std::vector<const FlagSpec*> CommandNode::inherited_flags() const {
  std::vector<const FlagSpec*> out;
  for(const CommandNode* at = parent_; at; at = at->parent_) {
    for(const auto& flag : at->spec_.flags) {
      if(flag.persistent) out.push_back(&flag);
    }
  }
  return out;
}

std::vector<const FlagSpec*> CommandNode::visible_flags() const {
  std::vector<const FlagSpec*> out;
  for(const auto& flag : spec_.flags) out.push_back(&flag);
  auto inherited = inherited_flags();
  out.insert(out.end(), inherited.begin(), inherited.end());
  return out;
}

bool CommandNode::has_flag(const std::string& name) const {
  for(const auto* flag : visible_flags()) {
    if(flag->name == name) return true;
  }
  return false;
}

void CommandNode::add_flag(FlagSpec flag) {
  for(const auto* existing : visible_flags()) {
    if(existing->name == flag.name) {
      throw std::invalid_argument("flag --" + flag.name + " redefined on '" + command_path() + "'");
    }
    if(!flag.shorthand.empty() && existing->shorthand == flag.shorthand) {
      throw std::invalid_argument("shorthand -" + flag.shorthand + " redefined on '" + command_path() + "'");
    }
  }
  if(flag.shorthand.size() > 1) {
    throw std::invalid_argument("shorthand for --" + flag.name + " must be one character");
  }
  spec_.flags.push_back(std::move(flag));
}

CommandNode& CommandNode::adopt(std::unique_ptr<CommandNode> child) {
  children_.push_back(std::move(child));
  return *children_.back();
}

// ---- FlagCommandTree -------------------------------------------------------

FlagCommandTree::FlagCommandTree(std::string program, std::string short_desc, std::string long_desc) {
  CommandSpec spec;
  spec.name = std::move(program);
  spec.short_desc = std::move(short_desc);
  spec.long_desc = std::move(long_desc);
  root_ = std::make_unique<CommandNode>(std::move(spec), nullptr);
}

CommandNode* FlagCommandTree::find(const std::vector<std::string>& path) const {
  CommandNode* at = root_.get();
  for(const auto& name : path) {
    at = at->find_child(name);
    if(!at) return nullptr;
  }
  return at;
}

CommandNode& FlagCommandTree::add_command(const std::vector<std::string>& parent_path, CommandSpec spec) {
  if(spec.name.empty() || spec.name.find(' ') != std::string::npos || spec.name[0] == '-') {
    throw std::invalid_argument("invalid command name '" + spec.name + "'");
  }
  CommandNode* parent = find(parent_path);
  if(!parent) {
    throw std::invalid_argument("unknown parent command '" + join(parent_path, " ") + "'");
  }
  if(parent->find_child(spec.name)) {
    throw std::invalid_argument("command '" + parent->command_path() + " " + spec.name + "' already registered");
  }
  auto flags = std::move(spec.flags);
  spec.flags.clear();
  auto& node = parent->adopt(std::make_unique<CommandNode>(std::move(spec), parent));
  for(auto& flag : flags) {
    node.add_flag(std::move(flag));
  }
  return node;
}

Resolution FlagCommandTree::resolve(const std::vector<std::string>& args) const {
  Resolution r;
  CommandNode* current = root_.get();
  bool descending = true;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];
    if(token == "--") {
      r.flag_tokens.insert(r.flag_tokens.end(), args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
      break;
    }
    if(FlagParser::is_option_token(token)) {
      r.flag_tokens.push_back(token);
      const FlagParser parser(current->visible_flags());
      const std::string* next = (i + 1 < args.size()) ? &args[i + 1] : nullptr;
      if(parser.consumes_next(token, next)) {
        r.flag_tokens.push_back(args[++i]);
      }
      continue;
    }
    if(descending) {
      if(auto* child = current->find_child(token)) {
        current = child;
        continue;
      }
      descending = false;
    }
    r.flag_tokens.push_back(token);
  }

  r.node = current;
  parse_flags(*current, r.flag_tokens, r.flags, r.args, r.error);
  return r;
}

bool FlagCommandTree::parse_flags(const CommandNode& node,
                                  const std::vector<std::string>& tokens,
                                  ParsedFlags& out,
                                  std::vector<std::string>& positional,
                                  std::string& error) const {
  out.clear();
  positional.clear();
  error.clear();
  const FlagParser parser(node.visible_flags());
  return parser.parse(tokens, out, positional, error);
}

std::string FlagCommandTree::default_suffix(const FlagSpec& flag) {
  const auto& value = flag.default_value;
  switch(flag.type) {
    case FlagType::String:
      if(value.is_string() && !value.get<std::string>().empty()) {
        return " (default \"" + value.get<std::string>() + "\")";
      }
      return "";
    case FlagType::Bool:
      return (value.is_boolean() && value.get<bool>()) ? " (default true)" : "";
    case FlagType::Int:
      return (value.is_number_integer() && value.get<long long>() != 0)
        ? " (default " + value.dump() + ")"
        : "";
    case FlagType::Duration:
      return (value.is_number_integer() && value.get<long long>() != 0)
        ? " (default " + format_duration(std::chrono::milliseconds(value.get<long long>())) + ")"
        : "";
    case FlagType::StringList:
      return "";
  }
  return "";
}

std::string FlagCommandTree::format_flags(const std::vector<const FlagSpec*>& flags) {
  std::vector<std::pair<std::string, std::string>> rows;
  std::size_t width = 0;
  for(const auto* flag : flags) {
    std::string left = flag->shorthand.empty()
      ? "      --" + flag->name
      : "  -" + flag->shorthand + ", --" + flag->name;
    if(flag->type != FlagType::Bool) {
      left += std::string(" ") + flag_type_name(flag->type);
    }
    width = std::max(width, left.size());
    rows.emplace_back(std::move(left), flag->usage + default_suffix(*flag));
  }
  std::ostringstream out;
  for(const auto& [left, right] : rows) {
    out << pad_right(left, width) << "   " << right << "\n";
  }
  return out.str();
}

void FlagCommandTree::render_help(const CommandNode& node, std::ostream& out) const {
  const auto& description = node.long_desc().empty() ? node.short_desc() : node.long_desc();
  if(!description.empty()) {
    out << description << "\n\n";
  }
  render_usage(node, out);
}

void FlagCommandTree::render_usage(const CommandNode& node, std::ostream& out) const {
  const auto path = node.command_path();
  const bool runnable = static_cast<bool>(node.action());
  const bool has_children = !node.children().empty();

  out << "Usage:\n";
  if(runnable || !has_children) {
    out << "  " << path << " [flags]";
    if(!node.args_usage().empty()) out << " " << node.args_usage();
    out << "\n";
  }
  if(has_children) {
    out << "  " << path << " [command]\n";
  }

  if(has_children) {
    std::size_t width = 11;
    for(const auto& child : node.children()) {
      width = std::max(width, child->name().size());
    }
    out << "\nAvailable Commands:\n";
    for(const auto& child : node.children()) {
      out << "  " << pad_right(child->name(), width) << " " << child->short_desc() << "\n";
    }
  }

  std::vector<const FlagSpec*> local;
  for(const auto& flag : node.local_flags()) local.push_back(&flag);
  if(!local.empty()) {
    out << "\nFlags:\n" << format_flags(local);
  }
  const auto inherited = node.inherited_flags();
  if(!inherited.empty()) {
    out << "\nGlobal Flags:\n" << format_flags(inherited);
  }

  if(has_children) {
    out << "\nUse \"" << path << " [command] --help\" for more information about a command.\n";
  }
  out.flush();
}

// ---- shared flag groups ----------------------------------------------------

void add_output_format_flags(CommandNode& node) {
  auto format = string_flag("format", "f", "tmpl", "The output format (tmpl, json, jsonp)");
  format.config_key = "volctl.cli.format";
  node.add_flag(std::move(format));

  auto templ = string_flag("template", "", "", "The template to use when --format is set to 'tmpl'");
  templ.config_key = "volctl.cli.template";
  node.add_flag(std::move(templ));

  auto tabs = bool_flag("templateTabs", "", true, "Align template output into tab-separated columns");
  tabs.config_key = "volctl.cli.templateTabs";
  node.add_flag(std::move(tabs));
}

void add_quiet_flag(CommandNode& node) {
  node.add_flag(bool_flag("quiet", "q", false, "Suppress table headers"));
}

void add_dry_run_flag(CommandNode& node) {
  node.add_flag(bool_flag("dryRun", "n", false,
                          "Show what action(s) will occur, but do not execute them"));
}

void add_continue_on_error_flag(CommandNode& node) {
  node.add_flag(bool_flag("continueOnError", "", false,
                          "Continue processing a collection upon error"));
}

void add_idempotent_flag(CommandNode& node) {
  node.add_flag(bool_flag("idempotent", "i", false, "Make this command idempotent"));
}

void add_async_flag(CommandNode& node) {
  node.add_flag(bool_flag("async", "", false,
                          "Return once the service accepts the request; failures are reported at exit"));
}
