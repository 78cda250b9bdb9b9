#include "cli/registry.hpp"
#include "gitwire/fs.hpp"
#include "gitwire/pack_validate.hpp"

#include <iomanip>
#include <iostream>
#include <string>

int cmd_verify_pack(int argc, char **argv) {
  bool verbose = false;
  std::string path;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-v" || arg == "--verbose")
      verbose = true;
    else
      path = arg;
  }
  if (path.empty())
    return gitwire::cli::usage_error("verify-pack");

  try {
    const auto bytes = gitwire::fs::read_file(path);
    const auto res = gitwire::pack::validate_pack_integrity(bytes);

    if (verbose) {
      for (const auto &id : res.object_ids)
        std::cout << id << "\n";
    }
    std::cout << "objects: " << res.parsed_objects << "/" << res.declared_objects << "\n";
    std::cout << "deltas: " << res.chains.chain_count << " (max depth " << res.chains.max_depth
              << ", average " << std::fixed << std::setprecision(2) << res.chains.average_depth
              << ")\n";
    if (!res.unresolved_bases.empty())
      std::cout << "thin pack, missing bases: " << res.unresolved_bases.size() << "\n";

    if (!res.valid) {
      for (const auto &e : res.errors)
        std::cerr << "verify-pack: " << e << "\n";
      return 1;
    }
    std::cout << path << ": ok\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "verify-pack: " << e.what() << "\n";
    return 1;
  }
}
