#include "control_signal.hpp"

#include <type_traits>

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

int exit_code_for(const SignalResult& signal) {
  if(!signal) return 0;
  return std::visit(overloaded{
    [](const HelpRequested&) { return 0; },
    [](const SubcommandHandled&) { return 0; },
    [](const ReportedError&) { return 1; },
    [](const ExitWithCode& exit) { return exit.code; },
  }, *signal);
}

std::string describe(const ControlSignal& signal) {
  return std::visit(overloaded{
    [](const HelpRequested&) -> std::string { return "help requested"; },
    [](const SubcommandHandled&) -> std::string { return "subcommand handled"; },
    [](const ReportedError&) -> std::string { return "reported error"; },
    [](const ExitWithCode& exit) -> std::string { return "exit with code " + std::to_string(exit.code); },
  }, signal);
}
