#include "command_tree.hpp"
#include "commands.hpp"
#include "test_runner_utils.hpp"

#include <stdexcept>

namespace volctl::test {
namespace {

SignalResult noop(InvocationState&, const std::vector<std::string>&) {
  return std::nullopt;
}

// volctl
//   volume (group)
//     ls   --attached
//     rm   --force
FlagCommandTree make_small_tree() {
  FlagCommandTree tree("volctl", "test tree");
  add_root_flags(tree.root());

  CommandSpec volume;
  volume.name = "volume";
  volume.short_desc = "The volume manager";
  tree.add_command({}, volume);

  CommandSpec ls;
  ls.name = "ls";
  ls.short_desc = "List volumes";
  ls.action = noop;
  ls.flags.push_back(bool_flag("attached", "", false, "Only attached volumes"));
  auto& ls_node = tree.add_command({"volume"}, ls);
  add_output_format_flags(ls_node);

  CommandSpec rm;
  rm.name = "rm";
  rm.short_desc = "Remove volumes";
  rm.args_usage = "[volumeID...]";
  rm.action = noop;
  auto& rm_node = tree.add_command({"volume"}, rm);
  rm_node.add_flag(bool_flag("force", "", false, "Force removal"));
  add_dry_run_flag(rm_node);
  add_quiet_flag(rm_node);
  return tree;
}

bool test_resolves_single_node(TestContext& ctx) {
  auto tree = make_small_tree();
  auto r = tree.resolve({"-l", "debug", "volume", "rm", "--force", "vol-1", "vol-2"});
  bool ok = ctx.expect(r.error.empty(), "unexpected error: " + r.error);
  ok &= ctx.expect(r.node && r.node->identity() == "volume rm", "target is volume rm");
  ok &= ctx.expect(r.args == std::vector<std::string>({"vol-1", "vol-2"}), "positional args");
  ok &= ctx.expect(r.flags.get_string("logLevel") == "debug", "persistent flag value");
  ok &= ctx.expect(r.flags.get_bool("force"), "local flag");
  ok &= ctx.expect(r.flag_tokens.size() == 5, "flag tokens kept for re-parse");
  return ok;
}

bool test_first_unmatched_token_ends_descent(TestContext& ctx) {
  auto tree = make_small_tree();
  auto r = tree.resolve({"volume", "bogus", "ls"});
  bool ok = ctx.expect(r.node && r.node->identity() == "volume", "stays at volume");
  ok &= ctx.expect(r.args == std::vector<std::string>({"bogus", "ls"}), "rest are args");

  auto after_dashes = tree.resolve({"volume", "--", "ls"});
  ok &= ctx.expect(after_dashes.node->identity() == "volume", "-- stops descent");
  ok &= ctx.expect(after_dashes.args == std::vector<std::string>({"ls"}), "-- passes ls through");
  return ok;
}

bool test_flag_values_are_not_command_names(TestContext& ctx) {
  auto tree = make_small_tree();
  // "volume" here is the value of --service, not the command.
  auto r = tree.resolve({"--service", "volume", "volume", "ls"});
  bool ok = ctx.expect(r.node && r.node->identity() == "volume ls", "resolves volume ls");
  ok &= ctx.expect(r.flags.get_string("service") == "volume", "service flag value");
  ok &= ctx.expect(r.args.empty(), "no positional args");
  return ok;
}

bool test_flag_grammar(TestContext& ctx) {
  auto tree = make_small_tree();
  bool ok = true;

  auto r = tree.resolve({"volume", "ls", "-fjson", "--template={{.id}}", "--templateTabs=false"});
  ok &= ctx.expect(r.error.empty(), "grammar error: " + r.error);
  ok &= ctx.expect(r.flags.get_string("format") == "json", "-fjson");
  ok &= ctx.expect(r.flags.get_string("template") == "{{.id}}", "--name=value");
  ok &= ctx.expect(!r.flags.get_bool("templateTabs") && r.flags.changed("templateTabs"), "bool literal");

  auto grouped = tree.resolve({"volume", "rm", "-qn", "vol-1"});
  ok &= ctx.expect(grouped.flags.get_bool("quiet") && grouped.flags.get_bool("dryRun"), "grouped shorthands");
  ok &= ctx.expect(grouped.args == std::vector<std::string>({"vol-1"}), "grouped leaves args");

  auto literal_id = tree.resolve({"volume", "rm", "--force", "1"});
  ok &= ctx.expect(literal_id.flags.get_bool("force"), "bare --force is true");
  ok &= ctx.expect(literal_id.args == std::vector<std::string>({"1"}), "--force leaves 1 as an argument");

  auto short_literal = tree.resolve({"volume", "rm", "-n", "0", "no"});
  ok &= ctx.expect(short_literal.flags.get_bool("dryRun"), "bare -n is true");
  ok &= ctx.expect(short_literal.args == std::vector<std::string>({"0", "no"}), "-n leaves 0 and no as arguments");

  auto short_eq = tree.resolve({"-l=info", "volume"});
  ok &= ctx.expect(short_eq.flags.get_string("logLevel") == "info", "-x=value");
  ok &= ctx.expect(!short_eq.flags.changed("config"), "untouched flags unchanged");
  return ok;
}

bool test_malformed_flags(TestContext& ctx) {
  auto tree = make_small_tree();
  bool ok = true;
  auto unknown = tree.resolve({"volume", "ls", "--bogus"});
  ok &= ctx.expect(unknown.error == "unknown flag: --bogus", "unknown long: " + unknown.error);
  ok &= ctx.expect(unknown.node->identity() == "volume ls", "node still resolved");

  auto unknown_short = tree.resolve({"volume", "rm", "-qz"});
  ok &= ctx.expect(contains(unknown_short.error, "unknown shorthand flag: 'z'"), "unknown short: " + unknown_short.error);

  auto missing = tree.resolve({"volume", "ls", "--format"});
  ok &= ctx.expect(missing.error == "flag needs an argument: --format", "missing value: " + missing.error);

  // Flags of a sibling are not visible.
  auto sibling = tree.resolve({"volume", "ls", "--force"});
  ok &= ctx.expect(!sibling.error.empty(), "sibling flag rejected");
  return ok;
}

bool test_registration_errors(TestContext& ctx) {
  auto tree = make_small_tree();
  bool ok = true;

  CommandSpec dup;
  dup.name = "ls";
  try {
    tree.add_command({"volume"}, dup);
    ok &= ctx.expect(false, "duplicate path accepted");
  } catch(const std::invalid_argument&) {
  }

  CommandSpec orphan;
  orphan.name = "x";
  try {
    tree.add_command({"nope"}, orphan);
    ok &= ctx.expect(false, "unknown parent accepted");
  } catch(const std::invalid_argument&) {
  }

  try {
    tree.find({"volume", "ls"})->add_flag(string_flag("other", "l", "", "clashes with -l"));
    ok &= ctx.expect(false, "shorthand clash with inherited flag accepted");
  } catch(const std::invalid_argument&) {
  }
  return ok;
}

bool test_usage_rendering(TestContext& ctx) {
  auto tree = make_small_tree();
  std::ostringstream group_usage;
  tree.render_usage(*tree.find({"volume"}), group_usage);
  const auto text = group_usage.str();

  bool ok = true;
  ok &= ctx.expect(contains(text, "Usage:\n  volctl volume [command]\n"), "group usage line");
  ok &= ctx.expect(contains(text, "Available Commands:\n"), "command list");
  ok &= ctx.expect(contains(text, "  ls          List volumes\n"), "aligned command row");
  ok &= ctx.expect(contains(text, "Global Flags:\n"), "inherited flags section");
  ok &= ctx.expect(contains(text, "  -l, --logLevel string"), "inherited flag row");
  ok &= ctx.expect(contains(text, "(default \"warn\")"), "string default shown");
  ok &= ctx.expect(contains(text, "Use \"volctl volume [command] --help\""), "footer");

  std::ostringstream leaf_help;
  tree.render_help(*tree.find({"volume", "rm"}), leaf_help);
  const auto help = leaf_help.str();
  ok &= ctx.expect(help.rfind("Remove volumes\n\nUsage:\n  volctl volume rm [flags] [volumeID...]\n", 0) == 0,
                   "leaf help header: " + help);
  ok &= ctx.expect(contains(help, "\nFlags:\n"), "local flags section");
  ok &= ctx.expect(contains(help, "  -n, --dryRun"), "dry run row");
  ok &= ctx.expect(!contains(help, "Available Commands"), "leaf lists no commands");
  return ok;
}

bool test_full_command_surface(TestContext& ctx) {
  auto tree = make_command_tree();
  bool ok = true;
  const std::vector<std::vector<std::string>> paths = {
    {"version"}, {"env"}, {"help"}, {"install"}, {"uninstall"},
    {"service", "start"}, {"service", "stop"}, {"service", "restart"},
    {"service", "status"}, {"service", "initsys"},
    {"module", "types"}, {"module", "instances", "list"},
    {"module", "instances", "create"}, {"module", "instances", "start"},
    {"adapter", "types"}, {"adapter", "instances"},
    {"volume", "ls"}, {"volume", "create"}, {"volume", "rm"}, {"volume", "attach"},
    {"volume", "detach"}, {"volume", "mount"}, {"volume", "unmount"}, {"volume", "path"},
    {"snapshot", "ls"}, {"snapshot", "create"}, {"snapshot", "rm"}, {"snapshot", "copy"},
    {"device", "ls"}, {"device", "mount"}, {"device", "unmount"}, {"device", "format"},
  };
  for(const auto& path : paths) {
    const auto* node = tree->find(path);
    std::string name;
    for(const auto& part : path) name += part + " ";
    ok &= ctx.expect(node != nullptr && static_cast<bool>(node->action()), "missing runnable " + name);
  }
  const auto* create = tree->find({"volume", "create"});
  ok &= ctx.expect(create && create->activate_client(), "storage commands activate the client");
  ok &= ctx.expect(create && create->has_flag("continueOnError") && create->has_flag("async"), "mutation flags");
  ok &= ctx.expect(!tree->find({"service", "status"})->activate_client(), "service verbs stay local");
  return ok;
}

} // namespace

std::vector<TestCase> command_tree_tests() {
  return {
    {"tree_resolves_single_node", test_resolves_single_node},
    {"tree_unmatched_token", test_first_unmatched_token_ends_descent},
    {"tree_flag_values", test_flag_values_are_not_command_names},
    {"tree_flag_grammar", test_flag_grammar},
    {"tree_malformed_flags", test_malformed_flags},
    {"tree_registration_errors", test_registration_errors},
    {"tree_usage_rendering", test_usage_rendering},
    {"tree_command_surface", test_full_command_surface},
  };
}

} // namespace volctl::test
