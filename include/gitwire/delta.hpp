#pragma once
#include "gitwire/error.hpp"

#include <cstdint>
#include <span>
#include <variant>
#include <vector>

/*
  Git delta format (pack objects of type OFS_DELTA / REF_DELTA):

    [varint source size][varint target size][instruction...]

  Copy   1xxxxxxx: bits 0-3 select little-endian offset bytes, bits 4-6
                   select size bytes; a size of 0 means 0x10000.
  Insert 0nnnnnnn: n (1..127) literal bytes follow. Opcode 0 is reserved.
*/

namespace gitwire::delta {

inline constexpr std::size_t kMaxVarintLen = 10;
inline constexpr std::size_t kMaxInsert    = 127;
inline constexpr std::size_t kMaxCopy      = 0x10000;

struct Varint {
  std::uint64_t value = 0;
  std::size_t bytes_read = 0;
};

// 7-bit little-endian groups, MSB = continuation. At most 10 bytes.
Result<Varint> parse_varint(std::span<const std::uint8_t> bytes, std::size_t offset = 0);
void append_varint(std::vector<std::uint8_t> &out, std::uint64_t value);
std::vector<std::uint8_t> encode_varint(std::uint64_t value);

struct Copy {
  std::uint64_t offset = 0;
  std::uint64_t size = 0;

  friend bool operator==(const Copy &, const Copy &) = default;
};

struct Insert {
  std::vector<std::uint8_t> bytes; // 1..127

  friend bool operator==(const Insert &, const Insert &) = default;
};

using Instruction = std::variant<Copy, Insert>;

struct Header {
  std::uint64_t source_size = 0;
  std::uint64_t target_size = 0;
  std::size_t length = 0; // bytes used by both varints
};

Result<Header> parse_header(std::span<const std::uint8_t> delta);

// Decode the instruction stream without a base (diagnostics, tests).
Result<std::vector<Instruction>> parse_instructions(std::span<const std::uint8_t> delta);

// Encode one instruction. Copies larger than 0xffffff or offsets above
// 32 bits throw Error(DeltaError).
void append_instruction(std::vector<std::uint8_t> &out, const Instruction &ins);

/**
 * Rebuild the target. Fails with DeltaError when the declared source size
 * differs from base.size(), a copy leaves [0, base.size()), output would
 * overrun the declared target size, opcode 0 appears, the stream is
 * truncated, or the final size differs from the declared one.
 */
Result<std::vector<std::uint8_t>> apply_delta(std::span<const std::uint8_t> base,
                                              std::span<const std::uint8_t> delta);

/**
 * Greedy single-pass delta: every 4-byte window of `base` is indexed by a
 * rolling hash, `target` is scanned left to right and the longest verified
 * match (4 bytes or more) at each position becomes a copy; everything else
 * is inserted literally.
 */
std::vector<std::uint8_t> create_delta(std::span<const std::uint8_t> base,
                                       std::span<const std::uint8_t> target);

} // namespace gitwire::delta
