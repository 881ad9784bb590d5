#include "commands.hpp"

#include "error_presenter.hpp"
#include "invocation_state.hpp"
#include "output_formatter.hpp"
#include "protocol.hpp"
#include "storage_client.hpp"

namespace {

SignalResult report_usage_error(InvocationState& state, const std::string& message) {
  ErrorPresenter().render(message, state.is_terminal, *state.err);
  if(state.tree && state.node) state.tree->render_usage(*state.node, *state.out);
  return ReportedError{};
}

nlohmann::json request_args(const InvocationState& state, const StorageOperation& operation) {
  nlohmann::json args = nlohmann::json::object();
  for(const auto& name : operation.arg_flags) {
    if(state.node && state.node->has_flag(name)) {
      args[name] = state.flags.value(name);
    }
  }
  if(state.node && state.node->has_flag("idempotent")) {
    args["idempotent"] = state.flags.get_bool("idempotent");
  }
  return args;
}

void collect_result(const nlohmann::json& result, nlohmann::json& collected) {
  if(result.is_array()) {
    for(const auto& item : result) collected.push_back(item);
  } else if(!result.is_null()) {
    collected.push_back(result);
  }
}

SignalResult print_version(InvocationState& state, const std::vector<std::string>&) {
  *state.out << "volctl\n"
             << "  Version:  " << VOLCTL_VERSION << "\n"
             << "  Protocol: " << kProtocolVersion << "\n";
  return std::nullopt;
}

SignalResult print_env(InvocationState& state, const std::vector<std::string>&) {
  nlohmann::json rows = nlohmann::json::array();
  for(const auto& key : state.config.keys()) {
    const auto tier = state.config.source(key);
    rows.push_back({
      {"key", key},
      {"value", state.config.value_as_string(key)},
      {"source", tier ? config_tier_name(*tier) : ""},
    });
  }
  std::string error;
  OutputFormatter formatter(output_options(state));
  if(!formatter.render(rows, {"key", "value", "source"}, *state.out, error)) {
    return report_usage_error(state, error);
  }
  return std::nullopt;
}

SignalResult print_help_topic(InvocationState& state, const std::vector<std::string>& args) {
  if(!state.tree) return ReportedError{};
  const auto* topic = state.tree->find(args);
  if(!topic) {
    std::string path;
    for(const auto& arg : args) path += (path.empty() ? "" : " ") + arg;
    return report_usage_error(state, "unknown help topic \"" + path + "\"");
  }
  state.tree->render_help(*topic, *state.out);
  return HelpRequested{};
}

CommandSpec storage_command(std::string name,
                            std::string short_desc,
                            std::string args_usage,
                            StorageOperation operation) {
  CommandSpec spec;
  spec.name = std::move(name);
  spec.short_desc = std::move(short_desc);
  spec.args_usage = std::move(args_usage);
  spec.action = storage_action(std::move(operation));
  spec.activate_client = true;
  return spec;
}

CommandSpec group(std::string name, std::string short_desc, std::string long_desc = {}) {
  CommandSpec spec;
  spec.name = std::move(name);
  spec.short_desc = std::move(short_desc);
  spec.long_desc = std::move(long_desc);
  return spec;
}

// List commands share the output flags; mutations also get the
// dry-run/idempotent/async family.
void add_list_flags(CommandNode& node) {
  add_output_format_flags(node);
  add_quiet_flag(node);
}

void add_mutation_flags(CommandNode& node, bool multi_target) {
  add_output_format_flags(node);
  add_dry_run_flag(node);
  add_idempotent_flag(node);
  add_async_flag(node);
  if(multi_target) add_continue_on_error_flag(node);
}

void register_module_commands(CommandTree& tree) {
  tree.add_command({}, group("module", "The module manager"));

  auto& types = tree.add_command({"module"}, storage_command(
    "types", "List the available module types", "",
    {"module.types", "", false, false, {"name", "description"}, {}}));
  add_list_flags(types);

  tree.add_command({"module"}, group("instances", "The module instance manager"));

  auto& list = tree.add_command({"module", "instances"}, storage_command(
    "list", "List the running module instances", "",
    {"module.instances.list", "", false, false, {"name", "type", "address", "started"}, {}}));
  add_list_flags(list);

  auto& create = tree.add_command({"module", "instances"}, storage_command(
    "create", "Create a new module instance", "",
    {"module.instances.create", "", false, false, {"name", "type", "address"},
     {"type", "name", "address", "options", "start"}}));
  create.add_flag(string_flag("type", "t", "storage", "The module type"));
  create.add_flag(string_flag("name", "", "", "The name of the module instance"));
  create.add_flag(string_flag("address", "a", "", "The address the instance listens on"));
  create.add_flag(list_flag("options", "o", "Module options as key=value pairs"));
  create.add_flag(bool_flag("start", "", false, "Start the instance once it is created"));
  add_mutation_flags(create, false);

  auto& start = tree.add_command({"module", "instances"}, storage_command(
    "start", "Start one or more module instances", "[name...]",
    {"module.instances.start", "name", true, true, {"name", "started"}, {}}));
  add_mutation_flags(start, true);
}

void register_adapter_commands(CommandTree& tree) {
  tree.add_command({}, group("adapter", "The adapter manager"));

  auto& types = tree.add_command({"adapter"}, storage_command(
    "types", "List the available adapter types", "",
    {"adapter.types", "", false, false, {"name", "description"}, {}}));
  add_list_flags(types);

  auto& instances = tree.add_command({"adapter"}, storage_command(
    "instances", "List the configured adapter instances", "[name...]",
    {"adapter.instances", "names", false, false, {"name", "driver", "service"}, {}}));
  add_list_flags(instances);
}

void register_volume_commands(CommandTree& tree) {
  tree.add_command({}, group("volume", "The volume manager",
                             "Create, inspect, attach and mount volumes of the configured storage service."));
  const std::vector<std::string> columns = {"id", "name", "size", "status"};

  auto& ls = tree.add_command({"volume"}, storage_command(
    "ls", "List volumes", "[volumeID...]",
    {"volume.list", "volumeIDs", false, false, columns, {"attached", "available", "path"}}));
  ls.add_flag(bool_flag("attached", "", false, "Only list volumes attached to this host"));
  ls.add_flag(bool_flag("available", "", false, "Only list volumes that can be attached"));
  ls.add_flag(bool_flag("path", "", false, "Include each volume's mount path"));
  add_list_flags(ls);

  auto& create = tree.add_command({"volume"}, storage_command(
    "create", "Create one or more volumes", "[name...]",
    {"volume.create", "name", true, true, columns,
     {"size", "iops", "type", "availabilityZone", "encrypted"}}));
  create.add_flag(int_flag("size", "", 0, "The size of the volume in GiB"));
  create.add_flag(int_flag("iops", "", 0, "The provisioned IOPS"));
  create.add_flag(string_flag("type", "", "", "The volume type"));
  create.add_flag(string_flag("availabilityZone", "", "", "The availability zone"));
  create.add_flag(bool_flag("encrypted", "", false, "Create an encrypted volume"));
  add_mutation_flags(create, true);

  auto& rm = tree.add_command({"volume"}, storage_command(
    "rm", "Remove one or more volumes", "[volumeID...]",
    {"volume.remove", "volumeID", true, true, columns, {"force"}}));
  rm.add_flag(bool_flag("force", "", false, "Remove the volume even when it is attached"));
  add_mutation_flags(rm, true);

  auto& attach = tree.add_command({"volume"}, storage_command(
    "attach", "Attach one or more volumes to this host", "[volumeID...]",
    {"volume.attach", "volumeID", true, true, columns, {"force"}}));
  attach.add_flag(bool_flag("force", "", false, "Detach the volume elsewhere first"));
  add_mutation_flags(attach, true);

  auto& detach = tree.add_command({"volume"}, storage_command(
    "detach", "Detach one or more volumes from this host", "[volumeID...]",
    {"volume.detach", "volumeID", true, true, columns, {"force"}}));
  detach.add_flag(bool_flag("force", "", false, "Detach even when the volume is mounted"));
  add_mutation_flags(detach, true);

  auto& mount = tree.add_command({"volume"}, storage_command(
    "mount", "Attach and mount one or more volumes", "[volumeID...]",
    {"volume.mount", "volumeID", true, true, {"id", "name", "path"}, {"fsType", "overwriteFs"}}));
  mount.add_flag(string_flag("fsType", "", "", "The filesystem to create when the volume has none"));
  mount.add_flag(bool_flag("overwriteFs", "", false, "Overwrite an existing filesystem"));
  add_mutation_flags(mount, true);

  auto& unmount = tree.add_command({"volume"}, storage_command(
    "unmount", "Unmount one or more volumes", "[volumeID...]",
    {"volume.unmount", "volumeID", true, true, columns, {}}));
  add_mutation_flags(unmount, true);

  auto& path = tree.add_command({"volume"}, storage_command(
    "path", "Print the mount path of one or more volumes", "[volumeID...]",
    {"volume.path", "volumeID", true, true, {"id", "path"}, {}}));
  add_list_flags(path);
  add_continue_on_error_flag(path);
}

void register_snapshot_commands(CommandTree& tree) {
  tree.add_command({}, group("snapshot", "The snapshot manager"));
  const std::vector<std::string> columns = {"id", "name", "volumeID", "status"};

  auto& ls = tree.add_command({"snapshot"}, storage_command(
    "ls", "List snapshots", "[snapshotID...]",
    {"snapshot.list", "snapshotIDs", false, false, columns, {}}));
  add_list_flags(ls);

  auto& create = tree.add_command({"snapshot"}, storage_command(
    "create", "Snapshot one or more volumes", "[volumeID...]",
    {"snapshot.create", "volumeID", true, true, columns, {"name", "description"}}));
  create.add_flag(string_flag("name", "", "", "The name of the snapshot"));
  create.add_flag(string_flag("description", "", "", "A description of the snapshot"));
  add_mutation_flags(create, true);

  auto& rm = tree.add_command({"snapshot"}, storage_command(
    "rm", "Remove one or more snapshots", "[snapshotID...]",
    {"snapshot.remove", "snapshotID", true, true, columns, {}}));
  add_mutation_flags(rm, true);

  auto& copy = tree.add_command({"snapshot"}, storage_command(
    "copy", "Copy one or more snapshots", "[snapshotID...]",
    {"snapshot.copy", "snapshotID", true, true, columns, {"destinationName", "destinationRegion"}}));
  copy.add_flag(string_flag("destinationName", "", "", "The name of the copy"));
  copy.add_flag(string_flag("destinationRegion", "", "", "The region to copy the snapshot to"));
  add_mutation_flags(copy, true);
}

void register_device_commands(CommandTree& tree) {
  tree.add_command({}, group("device", "The device manager"));
  const std::vector<std::string> columns = {"device", "volumeID", "path"};

  auto& ls = tree.add_command({"device"}, storage_command(
    "ls", "List the devices attached to this host", "",
    {"device.list", "", false, false, columns, {}}));
  add_list_flags(ls);

  auto& mount = tree.add_command({"device"}, storage_command(
    "mount", "Mount one or more devices", "[device...]",
    {"device.mount", "device", true, true, columns, {"mountPath", "options"}}));
  mount.add_flag(string_flag("mountPath", "", "", "Where to mount the device"));
  mount.add_flag(list_flag("options", "o", "Mount options"));
  add_mutation_flags(mount, true);

  auto& unmount = tree.add_command({"device"}, storage_command(
    "unmount", "Unmount one or more devices", "[mountPath...]",
    {"device.unmount", "mountPath", true, true, columns, {}}));
  add_mutation_flags(unmount, true);

  auto& format = tree.add_command({"device"}, storage_command(
    "format", "Create a filesystem on one or more devices", "[device...]",
    {"device.format", "device", true, true, columns, {"fsType", "overwriteFs"}}));
  format.add_flag(string_flag("fsType", "", "ext4", "The filesystem type"));
  format.add_flag(bool_flag("overwriteFs", "", false, "Overwrite an existing filesystem"));
  add_mutation_flags(format, true);
}

} // namespace

CommandAction storage_action(StorageOperation operation) {
  return [operation](InvocationState& state, const std::vector<std::string>& args) -> SignalResult {
    if(operation.requires_target && args.empty()) {
      return report_usage_error(state, "at least one argument is required");
    }

    const auto base = request_args(state, operation);
    std::vector<nlohmann::json> requests;
    if(operation.multi_target && !operation.target_key.empty()) {
      for(const auto& target : args) {
        auto request = base;
        request[operation.target_key] = target;
        requests.push_back(std::move(request));
      }
    } else {
      auto request = base;
      if(!operation.target_key.empty() && !args.empty()) {
        request[operation.target_key] = args;
      }
      requests.push_back(std::move(request));
    }

    const bool dry_run = state.flags.get_bool("dryRun");
    if(dry_run) {
      for(const auto& request : requests) {
        *state.out << "would " << operation.op << " " << request.dump() << "\n";
      }
      return std::nullopt;
    }
    if(!state.client) {
      ErrorPresenter().render("not connected to a storage service", state.is_terminal, *state.err);
      return ReportedError{};
    }

    const bool async = state.context.flag("async");
    const bool continue_on_error = state.flags.get_bool("continueOnError");
    nlohmann::json collected = nlohmann::json::array();
    bool failed = false;

    for(const auto& request : requests) {
      std::string error;
      auto reply = state.client->request(operation.op, request, async, error);
      if(!reply) {
        failed = true;
        ErrorPresenter().render(error, state.is_terminal, *state.err);
        if(!continue_on_error) return ReportedError{};
        state.logger->info("continuing after {} failed on {}: {}",
                           operation.op, state.context.text("storage.host"), error);
        continue;
      }
      if(reply->value("type", "") == "accepted") {
        const auto service = state.context.text("storage.service");
        *state.out << operation.op << ": accepted";
        if(!service.empty()) *state.out << " by " << service;
        *state.out << "\n";
        continue;
      }
      collect_result(reply->value("result", nlohmann::json()), collected);
    }

    if(!collected.empty() || is_read_operation(operation.op)) {
      std::string error;
      OutputFormatter formatter(output_options(state));
      if(!formatter.render(collected, operation.columns, *state.out, error)) {
        return report_usage_error(state, error);
      }
    }
    if(failed) return ReportedError{};
    return std::nullopt;
  };
}

void add_root_flags(CommandNode& root) {
  auto config = string_flag("config", "c", "", "The path to a custom JSON configuration file");
  config.config_key = "volctl.configFile";
  config.persistent = true;
  root.add_flag(std::move(config));

  auto log_level = string_flag("logLevel", "l", "warn", "The log level (trace, debug, info, warn, error, critical, off)");
  log_level.config_key = "volctl.logLevel";
  log_level.persistent = true;
  root.add_flag(std::move(log_level));

  auto host = string_flag("host", "", "", "The address of the storage service (tcp://host:port)");
  host.config_key = "volctl.host";
  host.persistent = true;
  root.add_flag(std::move(host));

  auto service = string_flag("service", "s", "", "The name of the storage service");
  service.config_key = "volctl.service";
  service.persistent = true;
  root.add_flag(std::move(service));

  auto help = bool_flag("help", "?", false, "Help about the current command");
  help.persistent = true;
  root.add_flag(std::move(help));

  auto verbose = bool_flag("verbose", "", false, "Print verbose help information");
  verbose.persistent = true;
  root.add_flag(std::move(verbose));
}

void register_commands(CommandTree& tree) {
  CommandSpec version;
  version.name = "version";
  version.short_desc = "Print the version";
  version.action = &print_version;
  version.run_lifecycle = false;
  tree.add_command({}, std::move(version));

  CommandSpec env;
  env.name = "env";
  env.short_desc = "Print the effective configuration";
  env.action = &print_env;
  auto& env_node = tree.add_command({}, std::move(env));
  add_list_flags(env_node);

  CommandSpec help;
  help.name = "help";
  help.short_desc = "Help about any command";
  help.args_usage = "[command...]";
  help.action = &print_help_topic;
  tree.add_command({}, std::move(help));

  register_service_commands(tree);
  register_module_commands(tree);
  register_adapter_commands(tree);
  register_volume_commands(tree);
  register_snapshot_commands(tree);
  register_device_commands(tree);
}

std::unique_ptr<CommandTree> make_command_tree() {
  auto tree = std::make_unique<FlagCommandTree>(
    "volctl",
    "A storage management tool",
    "volctl manages volumes, snapshots and devices through a storage service.\n"
    "Without --host it starts an embedded service for the duration of the command.");
  add_root_flags(tree->root());
  register_commands(*tree);
  return tree;
}
