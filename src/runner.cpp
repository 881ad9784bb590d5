#include "runner.hpp"

#include <cpptrace/cpptrace.hpp>
#include <cpptrace/from_current.hpp>

#include "error_presenter.hpp"
#include "invocation_state.hpp"
#include "storage_client.hpp"
#include "storage_service.hpp"

namespace {

// Stops the embedded service and drains asynchronous errors however the
// invocation ends.
class FinishGuard {
public:
  explicit FinishGuard(std::function<void()> finish) : finish_(std::move(finish)) {}
  ~FinishGuard() { run(); }

  void run() {
    if(!finish_) return;
    auto finish = std::move(finish_);
    finish_ = nullptr;
    finish();
  }

  FinishGuard(const FinishGuard&) = delete;
  FinishGuard& operator=(const FinishGuard&) = delete;

private:
  std::function<void()> finish_;
};

} // namespace

Runner::Runner(const CommandTree& tree, Options options)
  : tree_(tree), options_(std::move(options)) {
  if(!options_.out) options_.out = &std::cout;
  if(!options_.err) options_.err = &std::cerr;
  if(!options_.gate) options_.gate = std::make_shared<DefaultPermissionGate>();
  if(!options_.activator) options_.activator = std::make_shared<LocalClientActivator>();
  if(!options_.validator) options_.validator = std::make_shared<JsonConfigValidator>();
  if(!options_.env) options_.env = ConfigStore::process_environment();
}

int Runner::execute(const std::vector<std::string>& args) {
  InvocationState state;
  state.tree = &tree_;
  state.out = options_.out;
  state.err = options_.err;
  state.is_terminal = options_.terminal ? *options_.terminal : stderr_is_terminal();
  if(options_.logger) state.logger = options_.logger;

  FinishGuard guard([this, &state](){ finish(state); });

  SignalResult signal;
  CPPTRACE_TRY {
    signal = dispatch(state, args);
  } CPPTRACE_CATCH(const std::exception& e) {
    report_fault(state, e, cpptrace::from_current_exception());
    throw;
  }

  guard.run();
  const int code = exit_code_for(signal);
  if(holds<ExitWithCode>(signal)) {
    state.logger->debug("exiting with code {}", code);
  }
  return code;
}

SignalResult Runner::dispatch(InvocationState& state, const std::vector<std::string>& args) {
  std::vector<std::string> env_warnings;
  state.config.load_environment(options_.env, env_warnings);
  for(const auto& warning : env_warnings) {
    state.logger->warn("{}", warning);
  }

  auto resolution = tree_.resolve(args);
  state.node = resolution.node;
  state.flag_tokens = std::move(resolution.flag_tokens);
  state.flags = std::move(resolution.flags);
  state.args = std::move(resolution.args);

  std::string error = resolution.error;
  if(error.empty()) {
    bind_flags_to_config(*state.node, state.flags, state.config, error);
  }
  if(!error.empty()) {
    ErrorPresenter().render(error, state.is_terminal, *state.err);
    tree_.render_usage(*state.node, *state.out);
    return ReportedError{};
  }
  state.logger->trace("resolved '{}' with {} argument(s)", state.node->command_path(), state.args.size());

  if(state.node->run_lifecycle()) {
    Lifecycle lifecycle({
      options_.validator.get(),
      options_.gate.get(),
      options_.activator.get(),
      options_.observer,
      options_.publish_env,
    });
    if(auto signal = lifecycle.run(state)) return signal;
  }

  const auto& action = state.node->action();
  if(!action) {
    tree_.render_usage(*state.node, *state.out);
    return SubcommandHandled{};
  }
  return action(state, state.args);
}

void Runner::finish(InvocationState& state) const {
  if(state.client) state.client->close();
  if(state.service) state.service->stop();
  if(state.errors) {
    state.errors->close();
    for(const auto& failure : state.errors->drain()) {
      state.logger->error("asynchronous operation failed: {}", failure);
    }
    state.errors.reset();
  }
  if(options_.on_finish) {
    options_.on_finish(state);
  }
}

void Runner::report_fault(InvocationState& state,
                          const std::exception& e,
                          const cpptrace::stacktrace& trace) const {
  state.logger->fault("{}", e.what());
  trace.print(*state.err);
}
