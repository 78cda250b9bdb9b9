#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace gitwire::consts {

inline constexpr std::string_view kVersion     = "0.3.0";
inline constexpr std::string_view kAgent       = "gitwire/0.3.0";

// Directory and file names inside a git dir
inline constexpr std::string_view kObjectsDir  = "objects";
inline constexpr std::string_view kRefsDir     = "refs";
inline constexpr std::string_view kHeadFile    = "HEAD";
inline constexpr std::string_view kPackedRefs  = "packed-refs";
inline constexpr std::string_view kConfigFile  = "gitwire.conf";

// Git object type strings
inline constexpr std::string_view kTypeBlob    = "blob";
inline constexpr std::string_view kTypeTree    = "tree";
inline constexpr std::string_view kTypeCommit  = "commit";
inline constexpr std::string_view kTypeTag     = "tag";

// Tree entry modes (octal)
inline constexpr std::uint32_t kModeTree      = 0040000;
inline constexpr std::uint32_t kModeGitlink   = 0160000;

// Object ID sizes
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)
inline constexpr std::string_view kZeroOid = "0000000000000000000000000000000000000000";

// git:// daemon port
inline constexpr int portNumber = 9418;

// Object header prefixes (used in parsing)
inline constexpr std::string_view kTreePrefix      = "tree ";
inline constexpr std::string_view kRefPrefix       = "ref: ";
inline constexpr std::string_view kParentPrefix    = "parent ";
inline constexpr std::string_view kAuthorPrefix    = "author ";
inline constexpr std::string_view kCommitterPrefix = "committer ";
inline constexpr std::string_view kObjectPrefix    = "object ";
inline constexpr std::string_view kTypePrefix      = "type ";
inline constexpr std::string_view kTaggerPrefix    = "tagger ";

// Common characters
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

// pkt-line
inline constexpr std::size_t kPktHeaderLen   = 4;
inline constexpr std::size_t kPktMaxLen      = 65520;                       // header included

// Negotiation / request tokens
inline constexpr std::string_view kTokWant        = "want ";
inline constexpr std::string_view kTokHave        = "have ";
inline constexpr std::string_view kTokShallow     = "shallow ";
inline constexpr std::string_view kTokUnshallow   = "unshallow ";
inline constexpr std::string_view kTokDeepen      = "deepen ";
inline constexpr std::string_view kTokDeepenSince = "deepen-since ";
inline constexpr std::string_view kTokDeepenNot   = "deepen-not ";
inline constexpr std::string_view kTokFilter      = "filter ";
inline constexpr std::string_view kTokDone        = "done";
inline constexpr std::string_view kTokAck         = "ACK ";
inline constexpr std::string_view kTokNak         = "NAK";
inline constexpr std::string_view kTokVersion2    = "version 2";
inline constexpr std::string_view kTokCommand     = "command=";
inline constexpr std::string_view kServiceUpload  = "git-upload-pack";
inline constexpr std::string_view kCapsPseudoRef  = "capabilities^{}";
inline constexpr std::string_view kPeelSuffix     = "^{}";

// Packfile
inline constexpr std::string_view kPackSignature = "PACK";
inline constexpr std::uint32_t kPackVersion      = 2;
inline constexpr std::size_t kPackHeaderLen      = 12;
inline constexpr std::size_t kPackTrailerLen     = 20;

} // namespace gitwire::consts
