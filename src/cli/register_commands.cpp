#include "cli/registry.hpp"

int cmd_upload_pack(int, char **);
int cmd_daemon(int, char **);
int cmd_verify_pack(int, char **);

namespace gitwire::cli {

void register_all_commands() {
  register_command("upload-pack",
                   {::cmd_upload_pack, "Serve one fetch on stdin/stdout",
                    "[--stateless-rpc] [--advertise-refs] [--strict] [--timeout=<n>] <git-dir>"});
  register_command("daemon",
                   {::cmd_daemon, "Serve repositories below a directory over git://",
                    "[--base-path=<dir>] [port]"});
  register_command("verify-pack",
                   {::cmd_verify_pack, "Check the structure and checksum of a pack file",
                    "[-v] <file.pack>"});
}

} // namespace gitwire::cli
