#pragma once
#include "gitferry/remote.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace gitferry {

/**
 * Receiving side of an upload, backed by a directory:
 *   <root>/<agent>/chunk-<i>   one file per received chunk
 *   <root>/<agent>/total       chunk count announced by the sender
 * Chunks are stored by index, so resending one is harmless. The received
 * count is the contiguous prefix starting at chunk 0.
 */
class UploadReceiver {
public:
  explicit UploadReceiver(std::filesystem::path root) : root_(std::move(root)) {}

  [[nodiscard]] const std::filesystem::path& root() const { return root_; }
  // Throws std::runtime_error for ids that are not a single safe path component.
  [[nodiscard]] auto agent_dir(std::string_view agent_id) const -> std::filesystem::path;

  // std::nullopt when no upload is in progress for the agent.
  [[nodiscard]] auto chunks_received(std::string_view agent_id) const
      -> std::optional<std::uint64_t>;

  // Store one chunk and return the new received count.
  // A different total restarts the upload when sent with index 0, and is rejected otherwise.
  auto store_chunk(std::string_view agent_id, std::uint64_t index, std::uint64_t total_chunks,
                   std::string_view data) -> std::uint64_t;

  // Concatenate all chunks, parse as JSON, decode both artifacts into the agent
  // directory and drop the chunks.
  auto finalize(std::string_view agent_id) -> FinalizeResult;

private:
  std::filesystem::path root_;
};

namespace remote {

// UploadRemote that applies requests directly to a receiver store on this machine.
class LocalRemote : public UploadRemote {
public:
  explicit LocalRemote(std::filesystem::path store_root) : receiver_(std::move(store_root)) {}

  auto query_progress(const std::string& agent_id) -> std::optional<std::uint64_t> override;
  void submit_chunk(const std::string& agent_id, const ChunkUpload& chunk) override;
  auto finalize(const std::string& agent_id) -> FinalizeResult override;

  [[nodiscard]] const UploadReceiver& receiver() const { return receiver_; }

private:
  UploadReceiver receiver_;
};

} // namespace remote

} // namespace gitferry
