#include "cli/registry.hpp"
#include "gitwire/consts.hpp"

#include <iostream>
#include <string_view>

int main(int argc, char **argv) {
  using namespace gitwire;
  cli::register_all_commands();

  if (argc < 2) {
    cli::print_usage();
    return 2;
  }
  const std::string_view cmd = argv[1];

  if (cmd == "--version" || cmd == "version") {
    std::cout << "gitwire " << consts::kVersion << "\n";
    return 0;
  }
  if (cmd == "help" || cmd == "--help" || cmd == "-h") {
    if (argc > 2) {
      if (const auto *info = cli::find_command(argv[2])) {
        std::cerr << argv[2] << ": " << info->summary << "\n";
        (void)cli::usage_error(argv[2]);
        return 0;
      }
    }
    cli::print_usage();
    return 0;
  }

  const auto *info = cli::find_command(cmd);
  if (!info) {
    std::cerr << "gitwire: '" << cmd << "' is not a gitwire command\n\n";
    cli::print_usage();
    return 2;
  }
  // the handler sees its own name as argv[0]
  return info->fn(argc - 1, argv + 1);
}
