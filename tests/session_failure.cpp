#include "gitferry/chunker.hpp"
#include "gitferry/errors.hpp"
#include "gitferry/session.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

class FlakyRemote : public gitferry::UploadRemote {
public:
  std::uint64_t fail_on_index = UINT64_MAX;
  bool fail_finalize = false;
  std::vector<std::uint64_t> sent;
  std::function<void()> after_submit;

  std::optional<std::uint64_t> query_progress(const std::string &) override {
    return std::nullopt;
  }
  void submit_chunk(const std::string &, const gitferry::ChunkUpload &chunk) override {
    if (chunk.index == fail_on_index)
      throw gitferry::TransportError("HTTP 500");
    sent.push_back(chunk.index);
    if (after_submit)
      after_submit();
  }
  gitferry::FinalizeResult finalize(const std::string &) override {
    if (fail_finalize)
      throw gitferry::TransportError("finalize rejected");
    return {};
  }
};

} // namespace

int main() {
  const fs::path dir =
      fs::temp_directory_path() / ("gitferry_failure_" + std::to_string(std::random_device{}()));
  fs::create_directories(dir);

  try {
    {
      std::ofstream(dir / "f.bundle", std::ios::binary) << std::string(300, 'x');
      std::ofstream(dir / "f.patch", std::ios::binary) << std::string(40, 'y');
    }
    const gitferry::Envelope env{gitferry::describe_source(dir / "f.bundle"),
                                 gitferry::describe_source(dir / "f.patch"),
                                 gitferry::EnvelopeMetadata{}};

    // Count every generated chunk via the reader
    int reads = 0;
    const gitferry::AlignedRegionReader counting(
        [&](const fs::path &p, std::uint64_t offset, std::size_t length) {
          ++reads;
          return gitferry::read_range_base64(p, offset, length);
        });
    const std::uint64_t chunk_size = (env.total_length() + 4) / 5;
    const gitferry::ChunkGenerator gen(env, counting, chunk_size);
    if (gen.plan().total_chunks() != 5) {
      std::cerr << "expected 5 chunks, got " << gen.plan().total_chunks() << "\n";
      return 1;
    }

    gitferry::UploadRegistry registry;

    // Chunk 2 of 5 fails: nothing after it is generated or sent
    {
      FlakyRemote remote;
      remote.fail_on_index = 2;
      int reads_before_fail = -1;
      remote.after_submit = [&] { reads_before_fail = reads; };

      gitferry::TransferSession session(*registry.try_acquire("agent"), gen, remote);
      bool threw = false;
      try {
        session.run();
      } catch (const gitferry::TransportError &) {
        threw = true;
      }
      if (!threw || session.state() != gitferry::SessionState::Failed) {
        std::cerr << "failed chunk did not fail the session\n";
        return 1;
      }
      if (remote.sent != std::vector<std::uint64_t>{0, 1} || session.next_chunk_index() != 2) {
        std::cerr << "unexpected chunks sent before the failure\n";
        return 1;
      }
      if (session.error().find("HTTP 500") == std::string::npos) {
        std::cerr << "error not recorded: " << session.error() << "\n";
        return 1;
      }
      // Chunk 2 was generated (then rejected); chunk 3 never was
      const int chunk2_reads = reads - reads_before_fail;
      gitferry::ChunkGenerator probe(env, counting, chunk_size);
      const int before = reads;
      (void)probe.chunk(2);
      if (chunk2_reads != reads - before) {
        std::cerr << "chunks after the failed one were generated\n";
        return 1;
      }
      if (!session.progress() || session.progress()->percentage != 40) {
        std::cerr << "progress should stay at the last acknowledged chunk\n";
        return 1;
      }
      // The session cannot be restarted
      bool logic = false;
      try {
        session.run();
      } catch (const std::logic_error &) {
        logic = true;
      }
      if (!logic) {
        std::cerr << "second run() was allowed\n";
        return 1;
      }
    }
    if (registry.active("agent")) {
      std::cerr << "lease not released with the session\n";
      return 1;
    }

    // Finalize failure
    {
      FlakyRemote remote;
      remote.fail_finalize = true;
      gitferry::TransferSession session(*registry.try_acquire("agent"), gen, remote);
      bool threw = false;
      try {
        session.run();
      } catch (const gitferry::TransportError &) {
        threw = true;
      }
      if (!threw || session.state() != gitferry::SessionState::Failed || remote.sent.size() != 5) {
        std::cerr << "finalize failure not reported\n";
        return 1;
      }
    }

    // Cancel between chunks
    {
      FlakyRemote remote;
      gitferry::TransferSession session(*registry.try_acquire("agent"), gen, remote);
      remote.after_submit = [&] {
        if (remote.sent.size() == 3)
          session.request_stop();
      };
      bool threw = false;
      try {
        session.run();
      } catch (const std::runtime_error &) {
        threw = true;
      }
      if (!threw || session.state() != gitferry::SessionState::Failed || remote.sent.size() != 3) {
        std::cerr << "stop request not honoured\n";
        return 1;
      }
    }

    // One live upload per agent
    {
      auto first = registry.try_acquire("agent");
      if (!first || !registry.active("agent")) {
        std::cerr << "could not acquire a free agent\n";
        return 1;
      }
      if (registry.try_acquire("agent")) {
        std::cerr << "second concurrent upload was allowed\n";
        return 1;
      }
      if (!registry.try_acquire("other-agent")) {
        std::cerr << "agents are not independent\n";
        return 1;
      }
      auto moved = std::move(*first);
      first.reset();
      if (!registry.active("agent")) {
        std::cerr << "moved-from lease released the agent\n";
        return 1;
      }
    }
    if (registry.active("agent") || !registry.try_acquire("agent")) {
      std::cerr << "agent not released after the lease ended\n";
      return 1;
    }

    // Registries sharing a lock directory exclude each other
    {
      const fs::path locks = dir / "locks";
      gitferry::UploadRegistry first(locks);
      gitferry::UploadRegistry second(locks);
      auto held = first.try_acquire("agent");
      if (!held || !fs::exists(locks / "agent.lock")) {
        std::cerr << "lock file not taken\n";
        return 1;
      }
      if (second.try_acquire("agent")) {
        std::cerr << "second registry acquired a locked agent\n";
        return 1;
      }
      if (!second.try_acquire("other-agent")) {
        std::cerr << "lock on one agent blocked another\n";
        return 1;
      }

      // Another process sees the lock too
      const pid_t child = ::fork();
      if (child == 0) {
        gitferry::UploadRegistry theirs(locks);
        ::_exit(theirs.try_acquire("agent") ? 3 : 0);
      }
      int status = 0;
      if (child < 0 || ::waitpid(child, &status, 0) != child || !WIFEXITED(status) ||
          WEXITSTATUS(status) != 0) {
        std::cerr << "lock not honoured across processes\n";
        return 1;
      }

      held.reset();
      if (!second.try_acquire("agent")) {
        std::cerr << "lock not released with the lease\n";
        return 1;
      }

      bool threw = false;
      try {
        (void)first.try_acquire("../escape");
      } catch (const std::runtime_error &) {
        threw = true;
      }
      if (!threw) {
        std::cerr << "unsafe agent id used as a lock file name\n";
        return 1;
      }
    }

    std::cout << "session_failure OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(dir);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(dir, ec);
  return 0;
}
