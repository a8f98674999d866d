#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace gitferry {

struct ChunkUpload {
  std::uint64_t index = 0;
  std::uint64_t total_chunks = 0;
  std::string data;
};

struct FinalizeResult {
  std::uint64_t bundle_size = 0;
  std::uint64_t patch_size = 0;
};

// The three upload endpoints, addressed per agent. Failures throw TransportError.
class UploadRemote {
public:
  virtual ~UploadRemote() = default;

  // Chunks the remote already holds for this agent; std::nullopt if none.
  virtual auto query_progress(const std::string& agent_id) -> std::optional<std::uint64_t> = 0;

  // Must be idempotent for an already received index.
  virtual void submit_chunk(const std::string& agent_id, const ChunkUpload& chunk) = 0;

  // Reassemble, validate and extract. Idempotent once it has succeeded.
  virtual auto finalize(const std::string& agent_id) -> FinalizeResult = 0;
};

// "tcp://host[:port]" -> TCP remote, anything else -> receiver store directory.
auto open_remote(std::string_view url) -> std::unique_ptr<UploadRemote>;

} // namespace gitferry
