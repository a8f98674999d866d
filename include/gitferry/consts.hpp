#pragma once
#include <cstddef>
#include <string_view>

namespace gitferry::consts {

// Directory and file names
inline constexpr std::string_view kStateDir     = ".gitferry";
inline constexpr std::string_view kConfigFile   = "config";
inline constexpr std::string_view kUploadsDir   = "uploads";
inline constexpr std::string_view kLocksDir     = "locks";
inline constexpr std::string_view kLockSuffix   = ".lock";
inline constexpr std::string_view kChunkPrefix  = "chunk-";
inline constexpr std::string_view kTotalFile    = "total";
inline constexpr std::string_view kBundleFile   = "project.bundle";
inline constexpr std::string_view kPatchFile    = "project.patch";
inline constexpr std::string_view kMetadataFile = "bundle-metadata.json";

// Envelope literals
inline constexpr std::string_view kEnvelopePrefix = "{\"bundleBase64\":\"";
inline constexpr std::string_view kEnvelopeMiddle = "\",\"patchBase64\":\"";

// Base64 grouping
inline constexpr std::size_t kBase64Group = 4; // characters per group
inline constexpr std::size_t kBinaryGroup = 3; // bytes per group

// 1 MiB of envelope text per chunk => at most 768 KiB of aligned binary per read
inline constexpr std::size_t kDefaultChunkSize = 1024 * 1024;

// Largest chunk the receiver accepts in one request
inline constexpr std::size_t kMaxChunkBytes = 64 * 1024 * 1024;

// Object ID sizes
inline constexpr std::size_t kOidHexLen = 40; // 40 hex chars (SHA-1)

// Network defaults
inline constexpr std::string_view kDefaultHost = "127.0.0.1";
inline constexpr int portNumber = 9419;

// Protocol
inline constexpr std::string_view kHelloLine   = "HELLO 1";
inline constexpr std::string_view kOpProgress  = "OP PROGRESS ";
inline constexpr std::string_view kOpChunk     = "OP CHUNK ";
inline constexpr std::string_view kOpFinalize  = "OP FINALIZE ";
inline constexpr std::string_view kTokProgress = "PROGRESS ";
inline constexpr std::string_view kTokNone     = "NONE";
inline constexpr std::string_view kTokOk       = "OK";
inline constexpr std::string_view kTokErr      = "ERR ";

} // namespace gitferry::consts
