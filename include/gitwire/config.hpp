#pragma once
#include "gitwire/pack.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace gitwire {

// Server tunables, read from <git-dir>/gitwire.conf.
struct ServerConfig {
  std::string agent;            // "gitwire/<version>" unless overridden
  bool protocol_v2 = true;

  bool side_band_64k = true;
  bool thin_pack = true;
  bool ofs_delta = true;
  bool shallow = true;
  bool include_tag = true;
  bool no_done = true;

  std::uint32_t max_delta_depth = 50;
  std::size_t delta_window = 10;
  std::uint32_t min_delta_savings = 10; // percent
  int compression_level = 6;
  pack::OrderingStrategy ordering = pack::OrderingStrategy::TypeFirst;
  std::size_t batch_size = 256;

  [[nodiscard]] auto pack_options() const -> pack::PackOptions;
};

[[nodiscard]] ServerConfig default_server_config();

// Read gitwire.conf below `git_dir` (defaults if missing). Throws
// std::runtime_error on a malformed value.
ServerConfig load_server_config(const std::filesystem::path& git_dir);

// Overwrite gitwire.conf with every key.
void save_server_config(const std::filesystem::path& git_dir, const ServerConfig& cfg);

} // namespace gitwire
