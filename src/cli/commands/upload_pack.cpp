#include "cli/registry.hpp"
#include "gitwire/config.hpp"
#include "gitwire/connection.hpp"
#include "gitwire/object_store.hpp"
#include "gitwire/upload_pack.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <unistd.h>

int cmd_upload_pack(int argc, char **argv) {
  gitwire::UploadPackOptions opts;
  std::string dir;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--stateless-rpc") {
      opts.stateless_rpc = true;
    } else if (arg == "--advertise-refs" || arg == "--http-backend-info-refs") {
      opts.advertise_refs = true;
    } else if (arg == "--strict" || arg.rfind("--timeout=", 0) == 0) {
      // accepted for compatibility with git's option set
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "upload-pack: unknown option " << arg << "\n";
      return gitwire::cli::usage_error("upload-pack");
    } else {
      dir = arg;
    }
  }
  if (dir.empty())
    return gitwire::cli::usage_error("upload-pack");

  const auto git_dir = gitwire::resolve_git_dir(dir);
  if (!git_dir) {
    std::cerr << "upload-pack: not a git repository: " << dir << "\n";
    return 1;
  }
  if (const char *proto = std::getenv("GIT_PROTOCOL"))
    opts.version = gitwire::capabilities::requested_version(proto);

  std::signal(SIGPIPE, SIG_IGN);
  try {
    opts.config = gitwire::load_server_config(*git_dir);
    gitwire::LooseObjectStore store{*git_dir};
    gitwire::FdConnection conn{STDIN_FILENO, STDOUT_FILENO};
    gitwire::UploadPack session{store, std::move(opts)};
    if (auto st = session.serve(conn); !st) {
      std::cerr << "upload-pack: " << st.message << "\n";
      return 1;
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "upload-pack: " << e.what() << "\n";
    return 1;
  }
}
