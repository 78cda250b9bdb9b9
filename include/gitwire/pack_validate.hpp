#pragma once
#include "gitwire/pack.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace gitwire::pack {

struct ValidateOptions {
  bool walk_deltas = true;
  // Bases a thin pack may refer to without carrying them.
  std::vector<PackableObject> external_bases;
};

struct ChainStats {
  std::uint32_t chain_count = 0; // delta entries
  std::uint32_t max_depth = 0;
  double average_depth = 0.0;
};

struct ValidationResult {
  bool valid = false; // errors.empty()
  std::vector<std::string> errors;

  bool header_valid = false;
  bool checksum_valid = false;
  std::uint32_t declared_objects = 0;
  std::uint32_t parsed_objects = 0;

  std::vector<std::string> object_ids;       // resolved entries, pack order
  std::vector<std::string> unresolved_bases; // REF_DELTA bases neither in the pack nor given
  ChainStats chains;
};

/**
 * Re-read a pack: header, every entry header and zlib stream, the SHA-1
 * trailer and (when walk_deltas is set) every delta chain. Problems are
 * collected into `errors`; nothing here throws for bad input.
 *
 * A REF_DELTA whose base is missing is listed in unresolved_bases and is not
 * an error by itself: that is what a thin pack looks like.
 */
ValidationResult validate_pack_integrity(std::span<const std::uint8_t> bytes,
                                         const ValidateOptions &opts = {});

} // namespace gitwire::pack
