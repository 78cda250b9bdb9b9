#include "gitwire/fs.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <zlib.h>

namespace gitwire::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(p, ec);
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
      std::filesystem::remove(tmp);
      throw std::runtime_error("atomic replace failed: " + p.string() + ": " + ec.message());
    }
  }
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data, int level) {
  if (level < Z_DEFAULT_COMPRESSION || level > Z_BEST_COMPRESSION)
    throw std::runtime_error("zlib compress: bad level " + std::to_string(level));
  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  std::vector<std::uint8_t> out(bound);
  const int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef *>(data.data()),
                           static_cast<uLong>(data.size()), level);
  if (rc != Z_OK)
    throw std::runtime_error("zlib compress failed");
  out.resize(bound);
  return out;
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  auto res = z_inflate_prefix(data, data.size() * 3);
  if (res.consumed != data.size())
    throw std::runtime_error("zlib uncompress: trailing bytes after stream");
  return std::move(res.data);
}

Inflated z_inflate_prefix(std::span<const std::uint8_t> data, std::size_t size_hint) {
  z_stream zs{};
  if (inflateInit(&zs) != Z_OK)
    throw std::runtime_error("zlib inflateInit failed");

  Inflated out;
  out.data.resize(std::max<std::size_t>(size_hint, 64));
  zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());

  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    if (zs.total_out == out.data.size())
      out.data.resize(out.data.size() * 2);
    zs.next_out = out.data.data() + zs.total_out;
    zs.avail_out = static_cast<uInt>(out.data.size() - zs.total_out);
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc == Z_STREAM_END)
      break;
    if (rc == Z_BUF_ERROR && zs.avail_in == 0) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib uncompress: truncated stream");
    }
    if (rc != Z_OK && rc != Z_BUF_ERROR) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib uncompress failed");
    }
  }
  out.data.resize(zs.total_out);
  out.consumed = zs.total_in;
  inflateEnd(&zs);
  return out;
}

} // namespace gitwire::fs
