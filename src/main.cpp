#include <cpptrace/cpptrace.hpp>

#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "commands.hpp"
#include "log.hpp"
#include "runner.hpp"

int main(int argc, char** argv) {
  init_logging();

  std::unique_ptr<CommandTree> tree;
  try {
    tree = make_command_tree();
  } catch(const std::exception& e) {
    Logger logger("volctl-main");
    logger.critical("unable to build the command tree: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }

  std::vector<std::string> args;
  for(int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

  try {
    Runner runner(*tree, Runner::Options{});
    return runner.execute(args);
  } catch(const std::exception&) {
    // The Runner logs faults with their trace before rethrowing.
    return 1;
  }
}
