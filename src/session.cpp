#include "gitferry/session.hpp"

#include "gitferry/consts.hpp"
#include "gitferry/util.hpp"

#include <cerrno>
#include <fcntl.h>
#include <stdexcept>
#include <sys/file.h>
#include <system_error>
#include <utility>

namespace gitferry {

UploadLease::UploadLease(UploadLease &&other) noexcept
    : registry_(std::exchange(other.registry_, nullptr)), agent_id_(std::move(other.agent_id_)),
      lock_(std::move(other.lock_)) {}

UploadLease &UploadLease::operator=(UploadLease &&other) noexcept {
  if (this != &other) {
    release();
    registry_ = std::exchange(other.registry_, nullptr);
    agent_id_ = std::move(other.agent_id_);
    lock_ = std::move(other.lock_);
  }
  return *this;
}

UploadLease::~UploadLease() { release(); }

void UploadLease::release() noexcept {
  if (registry_ != nullptr) {
    lock_.reset(); // closing the descriptor drops the flock
    registry_->release(agent_id_);
    registry_ = nullptr;
  }
}

std::optional<net::UniqueFd> UploadRegistry::lock_file(const std::string &agent_id) {
  if (!is_valid_agent_id(agent_id)) {
    throw std::runtime_error("invalid agent id: '" + agent_id + "'");
  }
  std::error_code ec;
  std::filesystem::create_directories(lock_dir_, ec);
  if (ec) {
    throw std::system_error(ec, "create lock directory " + lock_dir_.string());
  }
  const auto path = lock_dir_ / (agent_id + std::string(consts::kLockSuffix));
  net::UniqueFd fd{::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644)};
  if (!fd) {
    throw std::system_error(errno, std::generic_category(), "open " + path.string());
  }
  if (::flock(fd.get(), LOCK_EX | LOCK_NB) != 0) {
    if (errno == EWOULDBLOCK) {
      return std::nullopt;
    }
    throw std::system_error(errno, std::generic_category(), "flock " + path.string());
  }
  return std::optional<net::UniqueFd>{std::move(fd)};
}

std::optional<UploadLease> UploadRegistry::try_acquire(const std::string &agent_id) {
  std::lock_guard<std::mutex> lock(mu_);
  if (active_.contains(agent_id)) {
    return std::nullopt;
  }
  net::UniqueFd held;
  if (!lock_dir_.empty()) {
    auto fd = lock_file(agent_id);
    if (!fd) {
      return std::nullopt; // held by another process or registry
    }
    held = std::move(*fd);
  }
  active_.insert(agent_id);
  return UploadLease{this, agent_id, std::move(held)};
}

bool UploadRegistry::active(std::string_view agent_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return active_.find(agent_id) != active_.end();
}

void UploadRegistry::release(const std::string &agent_id) noexcept {
  std::lock_guard<std::mutex> lock(mu_);
  active_.erase(agent_id);
}

std::string_view to_string(SessionState state) {
  switch (state) {
  case SessionState::Idle:
    return "idle";
  case SessionState::Resuming:
    return "resuming";
  case SessionState::Sending:
    return "sending";
  case SessionState::Finalizing:
    return "finalizing";
  case SessionState::Done:
    return "done";
  case SessionState::Failed:
    return "failed";
  }
  return "unknown";
}

TransferSession::TransferSession(UploadLease lease, const ChunkGenerator &generator,
                                 UploadRemote &remote, ProgressFn on_progress)
    : lease_(std::move(lease)), generator_(generator), remote_(remote),
      on_progress_(std::move(on_progress)),
      is_full_bundle_(!generator.envelope().metadata().is_incremental) {}

std::uint64_t TransferSession::resume_point() {
  const std::uint64_t total = generator_.plan().total_chunks();
  try {
    const auto received = remote_.query_progress(agent_id());
    if (!received) {
      return 0;
    }
    if (*received > total) {
      // Count from a different envelope
      resume_note_ = "remote reports " + std::to_string(*received) + " chunks but upload has " +
                     std::to_string(total) + "; starting over";
      return 0;
    }
    return *received;
  } catch (const std::exception &e) {
    // Re-sending is harmless: chunk delivery is idempotent by index
    resume_note_ = std::string("progress query failed, starting over: ") + e.what();
    return 0;
  }
}

void TransferSession::publish(std::uint64_t acknowledged) {
  const ChunkPlan &plan = generator_.plan();
  const std::uint64_t total = plan.total_chunks();
  ProgressSnapshot snap;
  snap.loaded_bytes = plan.loaded_bytes(acknowledged);
  snap.total_bytes = plan.total_length;
  snap.percentage = total == 0 ? 100 : static_cast<int>((200 * acknowledged + total) / (2 * total));
  snap.is_full_bundle = is_full_bundle_;
  progress_ = snap;
  if (on_progress_) {
    on_progress_(snap);
  }
}

void TransferSession::run() {
  if (state_ != SessionState::Idle) {
    throw std::logic_error("transfer session already ran");
  }
  try {
    state_ = SessionState::Resuming;
    next_chunk_index_ = resume_point();
    resumed_from_ = next_chunk_index_;

    state_ = SessionState::Sending;
    publish(next_chunk_index_);
    const std::uint64_t total = generator_.plan().total_chunks();
    while (next_chunk_index_ < total) {
      if (stop_requested_) {
        throw std::runtime_error("upload cancelled");
      }
      ChunkUpload upload{.index = next_chunk_index_,
                         .total_chunks = total,
                         .data = generator_.chunk(next_chunk_index_)};
      remote_.submit_chunk(agent_id(), upload);
      ++next_chunk_index_;
      publish(next_chunk_index_);
    }

    state_ = SessionState::Finalizing;
    finalize_result_ = remote_.finalize(agent_id());
    state_ = SessionState::Done;
    progress_.reset();
  } catch (const std::exception &e) {
    state_ = SessionState::Failed;
    error_ = e.what();
    throw;
  }
}

} // namespace gitferry
