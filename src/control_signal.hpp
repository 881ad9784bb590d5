#pragma once

#include <optional>
#include <string>
#include <variant>

// Non-local exits. A step or action returns one of these instead of
// continuing; every caller hands it straight back up until the Runner turns
// it into the process exit code.
struct HelpRequested {};
struct SubcommandHandled {};
struct ReportedError {};   // already rendered to the user
struct ExitWithCode {
  int code = 0;
};

using ControlSignal = std::variant<HelpRequested, SubcommandHandled, ReportedError, ExitWithCode>;
using SignalResult = std::optional<ControlSignal>;

int exit_code_for(const SignalResult& signal);
std::string describe(const ControlSignal& signal);

template<typename T>
bool holds(const SignalResult& signal) {
  return signal && std::holds_alternative<T>(*signal);
}
