#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st; // OpenSSL EVP_MD_CTX

namespace gitwire {

// Raw 20-byte SHA-1 object id (binary, not hex)
using oid = std::array<std::uint8_t, 20>;

/**
 * Compute SHA-1 of arbitrary bytes.
 * NOTE: For Git object ids, you must hash the full
 *   "<type> <size>\\0" + data
 * buffer. Use object_id(...) for that.
 */
oid sha1(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline oid sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/**
 * Incremental SHA-1 for data that arrives in pieces (pack trailers).
 * Owns its EVP context; not copyable.
 */
class Sha1 {
public:
  Sha1();
  ~Sha1();
  Sha1(const Sha1 &) = delete;
  auto operator=(const Sha1 &) -> Sha1 & = delete;

  void update(std::span<const std::uint8_t> data);
  // Returns the digest; the hasher is reset and can be reused.
  [[nodiscard]] auto finish() -> oid;

private:
  evp_md_ctx_st *ctx_;
};

/** Convert binary oid to 40-char lowercase hex. */
std::string to_hex(const oid &id);

/**
 * Parse 40-char hex into binary oid.
 * Returns false if length/characters are invalid.
 */
bool from_hex(std::string_view hex, oid &out);

/**
 * Build the Git object header used for hashing:
 *   "<type> <size>\\0"
 */
inline std::string object_header(std::string_view type, std::size_t size) {
  std::string s;
  s.reserve(type.size() + 1 + 20 + 1); // rough reserve
  s.append(type);
  s.push_back(' ');
  s.append(std::to_string(size));
  s.push_back('\0');
  return s;
}

// Git object id (40-hex) of a payload of the given type name.
std::string object_id(std::string_view type, std::span<const std::uint8_t> data);

} // namespace gitwire
