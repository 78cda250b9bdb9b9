#include "gitwire/config.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/fs.hpp"
#include "gitwire/util.hpp"

#include <sstream>
#include <stdexcept>
#include <string_view>

namespace {

auto bad_value(std::string_view key, std::string_view value) -> std::runtime_error {
  return std::runtime_error("gitwire.conf: bad value for " + std::string(key) + ": '" +
                            std::string(value) + "'");
}

bool parse_bool(std::string_view key, const std::string &v) {
  if (v == "true" || v == "yes" || v == "on" || v == "1")
    return true;
  if (v == "false" || v == "no" || v == "off" || v == "0")
    return false;
  throw bad_value(key, v);
}

std::uint64_t parse_number(std::string_view key, const std::string &v, std::uint64_t max) {
  const auto n = gitwire::strutil::parse_u64(v);
  if (!n || *n > max)
    throw bad_value(key, v);
  return *n;
}

const char *flag(bool b) { return b ? "true" : "false"; }

} // namespace

namespace gitwire {

namespace {
std::filesystem::path cfg_path(const std::filesystem::path &git_dir) {
  return git_dir / consts::kConfigFile;
}
} // namespace

pack::PackOptions ServerConfig::pack_options() const {
  pack::PackOptions opts;
  opts.ordering = ordering;
  opts.ofs_delta = ofs_delta;
  opts.chains.max_depth = max_delta_depth;
  opts.chains.window = delta_window;
  opts.chains.min_savings_percent = min_delta_savings;
  opts.compression_level = compression_level;
  opts.batch_size = batch_size;
  return opts;
}

ServerConfig default_server_config() {
  ServerConfig cfg;
  cfg.agent = std::string(consts::kAgent);
  return cfg;
}

auto load_server_config(const std::filesystem::path &git_dir) -> ServerConfig {
  ServerConfig out = default_server_config();
  const auto path = cfg_path(git_dir);
  if (!fs::exists(path))
    return out;

  const auto bytes = fs::read_file(path);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    const auto colon = sv.find(':');
    if (colon == std::string_view::npos)
      continue;
    const auto key = strutil::trim(sv.substr(0, colon));
    const auto value = strutil::trim(sv.substr(colon + 1));

    if (key == "agent") {
      if (value.empty())
        throw bad_value(key, value);
      out.agent = value;
    } else if (key == "protocol-v2") {
      out.protocol_v2 = parse_bool(key, value);
    } else if (key == "side-band-64k") {
      out.side_band_64k = parse_bool(key, value);
    } else if (key == "thin-pack") {
      out.thin_pack = parse_bool(key, value);
    } else if (key == "ofs-delta") {
      out.ofs_delta = parse_bool(key, value);
    } else if (key == "shallow") {
      out.shallow = parse_bool(key, value);
    } else if (key == "include-tag") {
      out.include_tag = parse_bool(key, value);
    } else if (key == "no-done") {
      out.no_done = parse_bool(key, value);
    } else if (key == "max-delta-depth") {
      out.max_delta_depth = static_cast<std::uint32_t>(parse_number(key, value, 4095));
    } else if (key == "delta-window") {
      out.delta_window = static_cast<std::size_t>(parse_number(key, value, 1000));
    } else if (key == "min-delta-savings") {
      out.min_delta_savings = static_cast<std::uint32_t>(parse_number(key, value, 100));
    } else if (key == "compression-level") {
      out.compression_level = static_cast<int>(parse_number(key, value, 9));
    } else if (key == "ordering") {
      const auto o = pack::ordering_from_string(value);
      if (!o)
        throw bad_value(key, value);
      out.ordering = *o;
    } else if (key == "batch-size") {
      const auto n = parse_number(key, value, 1u << 20);
      if (n == 0)
        throw bad_value(key, value);
      out.batch_size = static_cast<std::size_t>(n);
    }
  }
  return out;
}

void save_server_config(const std::filesystem::path &git_dir, const ServerConfig &cfg) {
  std::ostringstream os;
  os << "agent: " << cfg.agent << '\n'
     << "protocol-v2: " << flag(cfg.protocol_v2) << '\n'
     << "side-band-64k: " << flag(cfg.side_band_64k) << '\n'
     << "thin-pack: " << flag(cfg.thin_pack) << '\n'
     << "ofs-delta: " << flag(cfg.ofs_delta) << '\n'
     << "shallow: " << flag(cfg.shallow) << '\n'
     << "include-tag: " << flag(cfg.include_tag) << '\n'
     << "no-done: " << flag(cfg.no_done) << '\n'
     << "max-delta-depth: " << cfg.max_delta_depth << '\n'
     << "delta-window: " << cfg.delta_window << '\n'
     << "min-delta-savings: " << cfg.min_delta_savings << '\n'
     << "compression-level: " << cfg.compression_level << '\n'
     << "ordering: " << pack::to_string(cfg.ordering) << '\n'
     << "batch-size: " << cfg.batch_size << '\n';

  const std::string s = os.str();
  fs::write_file_atomic(cfg_path(git_dir), as_bytes(s));
}

} // namespace gitwire
