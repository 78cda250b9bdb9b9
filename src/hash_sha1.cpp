#include "gitwire/hash.hpp"
#include "gitwire/consts.hpp"

#include <cstdint>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gitwire {

oid sha1(std::span<const std::uint8_t> data) {
  Sha1 hasher;
  hasher.update(data);
  return hasher.finish();
}

Sha1::Sha1() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_, EVP_sha1(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha1) failed");
  }
}

Sha1::~Sha1() { EVP_MD_CTX_free(ctx_); }

void Sha1::update(std::span<const std::uint8_t> data) {
  if (!data.empty() && EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

auto Sha1::finish() -> oid {
  oid out{}; // 20 bytes
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  if (len != out.size()) {
    throw std::runtime_error("SHA-1 produced unexpected length");
  }
  if (EVP_DigestInit_ex(ctx_, EVP_sha1(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha1) failed");
  }
  return out;
}

std::string to_hex(const oid &id) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(consts::kOidHexLen);
  for (std::size_t i = 0; i < consts::kOidRawLen; ++i) {
    unsigned b = id[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

bool from_hex(std::string_view hex, oid &out) {
  if (hex.size() != consts::kOidHexLen) {
    return false;
  }
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
      return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
      return 10 + (c - 'A');
    }
    return -1;
  };
  for (std::size_t i = 0; i < consts::kOidRawLen; ++i) {
    int hi = nibble(hex[2 * i]);
    int lo = nibble(hex[(2 * i) + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return true;
}

std::string object_id(std::string_view type, std::span<const std::uint8_t> data) {
  const std::string hdr = object_header(type, data.size());
  Sha1 hasher;
  hasher.update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(hdr.data()),
                                              hdr.size()));
  hasher.update(data);
  return to_hex(hasher.finish());
}

} // namespace gitwire
