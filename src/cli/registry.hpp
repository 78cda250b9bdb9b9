#pragma once
#include <string>
#include <string_view>
#include "cli/command.hpp"

namespace gitwire::cli {

struct CommandInfo {
  command_fn fn = nullptr;
  std::string summary;  // one line for the command list
  std::string synopsis; // arguments, shown by "help <command>" and on misuse
};

void register_command(const std::string& name, CommandInfo info);
const CommandInfo* find_command(std::string_view name);

// Command list on stderr.
void print_usage();
// "usage: gitwire <name> <synopsis>" on stderr; returns 2 for the caller to exit with.
int usage_error(std::string_view name);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace gitwire::cli
