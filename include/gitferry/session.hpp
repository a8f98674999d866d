#pragma once
#include "gitferry/chunker.hpp"
#include "gitferry/net.hpp"
#include "gitferry/remote.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace gitferry {

class UploadRegistry;

// Proof that the holder owns the only upload for an agent. Released on destruction,
// together with the agent's lock file when the registry has a lock directory.
class UploadLease {
public:
  UploadLease(const UploadLease &) = delete;
  auto operator=(const UploadLease &) -> UploadLease & = delete;
  UploadLease(UploadLease &&other) noexcept;
  auto operator=(UploadLease &&other) noexcept -> UploadLease &;
  ~UploadLease();

  [[nodiscard]] const std::string &agent_id() const { return agent_id_; }

private:
  friend class UploadRegistry;
  UploadLease(UploadRegistry *registry, std::string agent_id, net::UniqueFd lock)
      : registry_(registry), agent_id_(std::move(agent_id)), lock_(std::move(lock)) {}

  void release() noexcept;

  UploadRegistry *registry_ = nullptr;
  std::string agent_id_;
  net::UniqueFd lock_; // flock()ed <lock_dir>/<agent>.lock, if any
};

/**
 * Owned by the caller; a live lease is the "upload in progress" marker for an
 * agent. Must outlive every lease it hands out.
 *
 * Without a lock directory exclusivity holds within this registry only. With
 * one, each lease also holds an flock() on <lock_dir>/<agent>.lock, so
 * registries in other processes sharing the directory are excluded too. The
 * kernel drops the lock if the process dies; lock files are never deleted.
 */
class UploadRegistry {
public:
  UploadRegistry() = default;
  explicit UploadRegistry(std::filesystem::path lock_dir) : lock_dir_(std::move(lock_dir)) {}

  // std::nullopt if another lease for `agent_id` is still alive. With a lock
  // directory, throws std::runtime_error for an invalid agent id and
  // std::system_error if the lock file cannot be opened.
  [[nodiscard]] auto try_acquire(const std::string &agent_id) -> std::optional<UploadLease>;
  [[nodiscard]] auto active(std::string_view agent_id) const -> bool;

private:
  friend class UploadLease;
  void release(const std::string &agent_id) noexcept;

  auto lock_file(const std::string &agent_id) -> std::optional<net::UniqueFd>;

  std::filesystem::path lock_dir_;
  mutable std::mutex mu_;
  std::set<std::string, std::less<>> active_;
};

enum class SessionState { Idle, Resuming, Sending, Finalizing, Done, Failed };

auto to_string(SessionState state) -> std::string_view;

struct ProgressSnapshot {
  std::uint64_t loaded_bytes = 0;
  std::uint64_t total_bytes = 0;
  int percentage = 0;
  bool is_full_bundle = true;
};

using ProgressFn = std::function<void(const ProgressSnapshot &)>;

/**
 * One upload attempt for one agent.
 *
 * run() asks the remote how many chunks it already holds, sends the rest
 * strictly in order (chunk N+1 is generated only after chunk N is
 * acknowledged), then finalizes. Any failure leaves the session Failed and is
 * rethrown; a new session picks up from the remote's count.
 */
class TransferSession {
public:
  TransferSession(UploadLease lease, const ChunkGenerator &generator, UploadRemote &remote,
                  ProgressFn on_progress = {});

  // Drive the session to Done; throws (state Failed) otherwise. Callable once.
  void run();

  // Cooperative cancel, honoured before the next chunk is generated.
  void request_stop() noexcept { stop_requested_ = true; }

  [[nodiscard]] const std::string &agent_id() const { return lease_.agent_id(); }
  [[nodiscard]] auto state() const -> SessionState { return state_; }
  [[nodiscard]] auto next_chunk_index() const -> std::uint64_t { return next_chunk_index_; }
  [[nodiscard]] auto resumed_from() const -> std::uint64_t { return resumed_from_; }
  // Why the resume point fell back to 0, if it did.
  [[nodiscard]] const std::string &resume_note() const { return resume_note_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  // Cleared once the session is Done.
  [[nodiscard]] const std::optional<ProgressSnapshot> &progress() const { return progress_; }
  [[nodiscard]] const FinalizeResult &finalize_result() const { return finalize_result_; }

private:
  auto resume_point() -> std::uint64_t;
  void publish(std::uint64_t acknowledged);

  UploadLease lease_;
  const ChunkGenerator &generator_;
  UploadRemote &remote_;
  ProgressFn on_progress_;
  bool is_full_bundle_;

  SessionState state_ = SessionState::Idle;
  std::uint64_t next_chunk_index_ = 0;
  std::uint64_t resumed_from_ = 0;
  std::string resume_note_;
  std::string error_;
  std::optional<ProgressSnapshot> progress_;
  FinalizeResult finalize_result_;
  std::atomic<bool> stop_requested_{false};
};

} // namespace gitferry
