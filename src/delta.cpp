#include "gitwire/delta.hpp"

#include <algorithm>
#include <bit>
#include <string>

namespace gitwire::delta {

namespace {

constexpr std::size_t kWindow = 4;
constexpr std::size_t kMinCopy = 4;
constexpr std::size_t kMaxBucket = 64;
constexpr std::uint64_t kRabinBase = 257;
constexpr std::uint64_t kRabinMod = 0x7fffffff;
constexpr std::uint64_t kMaxCopyOffset = 0xffffffffULL;

constexpr std::uint64_t rabin_pow() {
  std::uint64_t p = 1;
  for (std::size_t i = 0; i < kWindow; ++i)
    p = (p * kRabinBase) % kRabinMod;
  return p;
}
constexpr std::uint64_t kRabinPow = rabin_pow();

auto delta_error(const std::string &msg) -> Status {
  return Status::error(ErrorKind::DeltaError, msg);
}

auto rabin_hash(std::span<const std::uint8_t> data, std::size_t off) -> std::uint64_t {
  std::uint64_t h = 0;
  for (std::size_t i = 0; i < kWindow; ++i)
    h = (h * kRabinBase + data[off + i]) % kRabinMod;
  return h;
}

auto rabin_roll(std::uint64_t h, std::uint8_t outgoing, std::uint8_t incoming) -> std::uint64_t {
  // (h*B - out*B^W + in) mod M, kept non-negative
  const std::uint64_t grown = (h * kRabinBase) % kRabinMod;
  const std::uint64_t drop = (outgoing * kRabinPow) % kRabinMod;
  return (grown + kRabinMod - drop + incoming) % kRabinMod;
}

// Bucketed positions of every 4-byte window of the base. Buckets are capped
// so a run of identical bytes cannot make lookups quadratic.
class WindowIndex {
public:
  explicit WindowIndex(std::span<const std::uint8_t> base) {
    const std::size_t windows = base.size() >= kWindow ? base.size() - kWindow + 1 : 0;
    const std::size_t target_buckets = std::max<std::size_t>(256, (windows + 3) / 4);
    bucket_count_ = std::bit_ceil(target_buckets);
    offsets_.resize(bucket_count_ * kMaxBucket);
    counts_.resize(bucket_count_);
    if (windows == 0)
      return;

    std::uint64_t h = rabin_hash(base, 0);
    add(h, 0);
    for (std::size_t i = 1; i < windows && i <= kMaxCopyOffset; ++i) {
      h = rabin_roll(h, base[i - 1], base[i + kWindow - 1]);
      add(h, i);
    }
  }

  [[nodiscard]] auto lookup(std::uint64_t h) const -> std::span<const std::uint32_t> {
    const std::size_t b = h & (bucket_count_ - 1);
    return {offsets_.data() + b * kMaxBucket, counts_[b]};
  }

private:
  void add(std::uint64_t h, std::size_t off) {
    const std::size_t b = h & (bucket_count_ - 1);
    if (counts_[b] < kMaxBucket) {
      offsets_[b * kMaxBucket + counts_[b]] = static_cast<std::uint32_t>(off);
      ++counts_[b];
    }
  }

  std::size_t bucket_count_ = 0;
  std::vector<std::uint32_t> offsets_;
  std::vector<std::uint16_t> counts_;
};

auto match_length(std::span<const std::uint8_t> a, std::size_t ai,
                  std::span<const std::uint8_t> b, std::size_t bi, std::size_t max) -> std::size_t {
  std::size_t n = 0;
  while (n < max && a[ai + n] == b[bi + n])
    ++n;
  return n;
}

void emit_inserts(std::vector<std::uint8_t> &out, std::span<const std::uint8_t> data,
                  std::size_t start, std::size_t end) {
  while (start < end) {
    const std::size_t n = std::min(kMaxInsert, end - start);
    out.push_back(static_cast<std::uint8_t>(n));
    out.insert(out.end(), data.begin() + static_cast<std::ptrdiff_t>(start),
               data.begin() + static_cast<std::ptrdiff_t>(start + n));
    start += n;
  }
}

void emit_copies(std::vector<std::uint8_t> &out, std::uint64_t offset, std::uint64_t size) {
  while (size > 0) {
    const std::uint64_t n = std::min<std::uint64_t>(size, kMaxCopy);
    append_instruction(out, Copy{offset, n});
    offset += n;
    size -= n;
  }
}

} // namespace

Result<Varint> parse_varint(std::span<const std::uint8_t> bytes, std::size_t offset) {
  Varint v;
  unsigned shift = 0;
  for (std::size_t i = 0; i < kMaxVarintLen; ++i) {
    if (offset + i >= bytes.size()) {
      return delta_error("truncated varint");
    }
    const std::uint8_t b = bytes[offset + i];
    if (shift == 63 && (b & 0x7e) != 0) {
      return delta_error("varint overflows 64 bits");
    }
    v.value |= static_cast<std::uint64_t>(b & 0x7f) << shift;
    if ((b & 0x80) == 0) {
      v.bytes_read = i + 1;
      return v;
    }
    shift += 7;
  }
  return delta_error("varint longer than 10 bytes");
}

void append_varint(std::vector<std::uint8_t> &out, std::uint64_t value) {
  do {
    std::uint8_t b = value & 0x7f;
    value >>= 7;
    if (value != 0)
      b |= 0x80;
    out.push_back(b);
  } while (value != 0);
}

std::vector<std::uint8_t> encode_varint(std::uint64_t value) {
  std::vector<std::uint8_t> out;
  append_varint(out, value);
  return out;
}

Result<Header> parse_header(std::span<const std::uint8_t> delta) {
  auto src = parse_varint(delta, 0);
  if (!src)
    return src.status();
  auto dst = parse_varint(delta, src.value().bytes_read);
  if (!dst)
    return dst.status();
  return Header{src.value().value, dst.value().value,
                src.value().bytes_read + dst.value().bytes_read};
}

Result<std::vector<Instruction>> parse_instructions(std::span<const std::uint8_t> delta) {
  auto hdr = parse_header(delta);
  if (!hdr)
    return hdr.status();

  std::vector<Instruction> out;
  std::size_t pos = hdr.value().length;
  while (pos < delta.size()) {
    const std::uint8_t op = delta[pos++];
    if (op & 0x80) {
      Copy c;
      for (unsigned i = 0; i < 4; ++i) {
        if (op & (1U << i)) {
          if (pos >= delta.size())
            return delta_error("truncated copy offset");
          c.offset |= static_cast<std::uint64_t>(delta[pos++]) << (8 * i);
        }
      }
      for (unsigned i = 0; i < 3; ++i) {
        if (op & (0x10U << i)) {
          if (pos >= delta.size())
            return delta_error("truncated copy size");
          c.size |= static_cast<std::uint64_t>(delta[pos++]) << (8 * i);
        }
      }
      if (c.size == 0)
        c.size = kMaxCopy;
      out.emplace_back(c);
    } else if (op != 0) {
      if (delta.size() - pos < op)
        return delta_error("truncated insert");
      out.emplace_back(Insert{{delta.begin() + static_cast<std::ptrdiff_t>(pos),
                               delta.begin() + static_cast<std::ptrdiff_t>(pos + op)}});
      pos += op;
    } else {
      return delta_error("invalid delta opcode 0");
    }
  }
  return out;
}

void append_instruction(std::vector<std::uint8_t> &out, const Instruction &ins) {
  if (const auto *ins_lit = std::get_if<Insert>(&ins)) {
    if (ins_lit->bytes.empty() || ins_lit->bytes.size() > kMaxInsert) {
      throw Error(ErrorKind::DeltaError, "insert must carry 1..127 bytes");
    }
    out.push_back(static_cast<std::uint8_t>(ins_lit->bytes.size()));
    out.insert(out.end(), ins_lit->bytes.begin(), ins_lit->bytes.end());
    return;
  }

  const auto &c = std::get<Copy>(ins);
  if (c.offset > kMaxCopyOffset || c.size == 0 || c.size > 0xffffff) {
    throw Error(ErrorKind::DeltaError, "copy out of encodable range");
  }
  std::uint8_t op = 0x80;
  std::uint8_t args[7];
  std::size_t n = 0;
  for (unsigned i = 0; i < 4; ++i) {
    const auto byte = static_cast<std::uint8_t>((c.offset >> (8 * i)) & 0xff);
    if (byte != 0) {
      op |= static_cast<std::uint8_t>(1U << i);
      args[n++] = byte;
    }
  }
  if (c.size != kMaxCopy) {
    for (unsigned i = 0; i < 3; ++i) {
      const auto byte = static_cast<std::uint8_t>((c.size >> (8 * i)) & 0xff);
      if (byte != 0) {
        op |= static_cast<std::uint8_t>(0x10U << i);
        args[n++] = byte;
      }
    }
  }
  out.push_back(op);
  out.insert(out.end(), args, args + n);
}

Result<std::vector<std::uint8_t>> apply_delta(std::span<const std::uint8_t> base,
                                              std::span<const std::uint8_t> delta) {
  auto hdr = parse_header(delta);
  if (!hdr)
    return hdr.status();
  const auto [source_size, target_size, header_len] = hdr.value();
  if (source_size != base.size()) {
    return delta_error("delta expects a " + std::to_string(source_size) + "-byte base, got " +
                       std::to_string(base.size()));
  }

  std::vector<std::uint8_t> out;
  out.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(target_size, 1U << 26)));

  std::size_t pos = header_len;
  while (pos < delta.size()) {
    const std::uint8_t op = delta[pos++];
    if (op & 0x80) {
      std::uint64_t offset = 0;
      std::uint64_t size = 0;
      for (unsigned i = 0; i < 4; ++i) {
        if (op & (1U << i)) {
          if (pos >= delta.size())
            return delta_error("truncated copy offset");
          offset |= static_cast<std::uint64_t>(delta[pos++]) << (8 * i);
        }
      }
      for (unsigned i = 0; i < 3; ++i) {
        if (op & (0x10U << i)) {
          if (pos >= delta.size())
            return delta_error("truncated copy size");
          size |= static_cast<std::uint64_t>(delta[pos++]) << (8 * i);
        }
      }
      if (size == 0)
        size = kMaxCopy;
      if (offset > base.size() || size > base.size() - offset) {
        return delta_error("copy [" + std::to_string(offset) + ", +" + std::to_string(size) +
                           ") outside " + std::to_string(base.size()) + "-byte base");
      }
      if (size > target_size - out.size()) {
        return delta_error("copy overruns declared target size");
      }
      out.insert(out.end(), base.begin() + static_cast<std::ptrdiff_t>(offset),
                 base.begin() + static_cast<std::ptrdiff_t>(offset + size));
    } else if (op != 0) {
      if (delta.size() - pos < op)
        return delta_error("truncated insert");
      if (op > target_size - out.size())
        return delta_error("insert overruns declared target size");
      out.insert(out.end(), delta.begin() + static_cast<std::ptrdiff_t>(pos),
                 delta.begin() + static_cast<std::ptrdiff_t>(pos + op));
      pos += op;
    } else {
      return delta_error("invalid delta opcode 0");
    }
  }

  if (out.size() != target_size) {
    return delta_error("delta produced " + std::to_string(out.size()) + " bytes, expected " +
                       std::to_string(target_size));
  }
  return out;
}

std::vector<std::uint8_t> create_delta(std::span<const std::uint8_t> base,
                                       std::span<const std::uint8_t> target) {
  std::vector<std::uint8_t> out;
  append_varint(out, base.size());
  append_varint(out, target.size());
  if (target.empty())
    return out;
  if (base.size() < kWindow || target.size() < kWindow) {
    emit_inserts(out, target, 0, target.size());
    return out;
  }

  const WindowIndex index(base);
  std::size_t pos = 0;
  std::size_t insert_start = 0;
  std::uint64_t h = rabin_hash(target, 0);

  while (pos < target.size()) {
    std::size_t best_off = 0;
    std::size_t best_len = 0;
    if (pos + kWindow <= target.size()) {
      for (const std::uint32_t cand : index.lookup(h)) {
        const std::size_t max = std::min(base.size() - cand, target.size() - pos);
        const std::size_t len = match_length(base, cand, target, pos, max);
        if (len > best_len) {
          best_len = len;
          best_off = cand;
        }
      }
    }

    if (best_len >= kMinCopy) {
      emit_inserts(out, target, insert_start, pos);
      emit_copies(out, best_off, best_len);
      pos += best_len;
      insert_start = pos;
      if (pos + kWindow <= target.size())
        h = rabin_hash(target, pos);
    } else {
      ++pos;
      if (pos + kWindow <= target.size())
        h = rabin_roll(h, target[pos - 1], target[pos + kWindow - 1]);
    }
  }
  emit_inserts(out, target, insert_start, target.size());
  return out;
}

} // namespace gitwire::delta
