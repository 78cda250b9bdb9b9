#include "cli/registry.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <utility>

namespace gitwire::cli {

namespace {

auto commands() -> std::map<std::string, CommandInfo, std::less<>> & {
  static std::map<std::string, CommandInfo, std::less<>> by_name;
  return by_name;
}

} // namespace

void register_command(const std::string &name, CommandInfo info) {
  commands().insert_or_assign(name, std::move(info));
}

const CommandInfo *find_command(std::string_view name) {
  const auto it = commands().find(name);
  return it == commands().end() ? nullptr : &it->second;
}

void print_usage() {
  std::cerr << "usage: gitwire <command> [args]\n"
            << "       gitwire help <command>\n\n"
            << "commands:\n";
  std::size_t width = 0;
  for (const auto &[name, info] : commands())
    width = std::max(width, name.size());
  for (const auto &[name, info] : commands())
    std::cerr << "  " << name << std::string(width - name.size() + 2, ' ') << info.summary << "\n";
}

int usage_error(std::string_view name) {
  const auto *info = find_command(name);
  std::cerr << "usage: gitwire " << name;
  if (info && !info->synopsis.empty())
    std::cerr << " " << info->synopsis;
  std::cerr << "\n";
  return 2;
}

} // namespace gitwire::cli
