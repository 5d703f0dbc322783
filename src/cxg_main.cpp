#include <cxg/cli.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage() {
  std::cout << "Usage: cxg <command> [options]\n\n"
            << "Commands:\n"
            << "  scan      Classify source files for disclosure risk "
               "(default if no\n"
            << "            command is given).\n"
            << "  history   Show recently persisted scans.\n\n"
            << "Run 'cxg scan --help' for scan options.\n";
}
} // namespace

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (!arguments.empty() &&
        (arguments.front() == "--help" || arguments.front() == "-h")) {
      PrintGlobalUsage();
      return 0;
    }

    std::string command = "scan";
    std::size_t first_argument_index = 0;
    if (!arguments.empty() && arguments.front().rfind('-', 0) != 0) {
      command = arguments.front();
      first_argument_index = 1;
    }
    const std::vector<std::string> command_arguments(
        arguments.begin() + static_cast<std::ptrdiff_t>(first_argument_index),
        arguments.end());

    if (command == "scan") {
      return cxg::RunScan(command_arguments, std::cout);
    }
    if (command == "history") {
      return cxg::RunHistory(command_arguments, std::cout);
    }

    throw std::invalid_argument("Unknown command: " + command);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    PrintGlobalUsage();
    return 1;
  }
}
