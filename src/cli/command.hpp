#pragma once

namespace gitwire::cli {

// argv[0] is the subcommand name. Returns the process exit status:
// 0 success, 1 failure, 2 bad invocation.
using command_fn = int (*)(int argc, char **argv);

} // namespace gitwire::cli
