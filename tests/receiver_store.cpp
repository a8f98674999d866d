#include "gitferry/consts.hpp"
#include "gitferry/errors.hpp"
#include "gitferry/fs.hpp"
#include "gitferry/receiver.hpp"
#include "gitferry/session.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace stdfs = std::filesystem;

static std::vector<std::uint8_t> write_random(const stdfs::path &p, std::size_t n,
                                              unsigned seed) {
  std::vector<std::uint8_t> bytes(n);
  std::mt19937 rng(seed);
  for (auto &b : bytes)
    b = static_cast<std::uint8_t>(rng());
  gitferry::fs::write_file_atomic(p, bytes);
  return bytes;
}

template <typename E, typename F> static bool throws(F &&f) {
  try {
    f();
  } catch (const E &) {
    return true;
  }
  return false;
}

int main() {
  const stdfs::path dir =
      stdfs::temp_directory_path() / ("gitferry_recv_" + std::to_string(std::random_device{}()));
  const stdfs::path work = dir / "work";
  const stdfs::path store = dir / "store";
  stdfs::create_directories(work);

  try {
    // End to end through the local remote: bytes come out identical
    const auto bundle = write_random(work / "x.bundle", 4099, 11);
    const auto patch = write_random(work / "x.patch", 1000, 12);
    gitferry::EnvelopeMetadata meta;
    meta.is_incremental = true;
    meta.base_commit_sha = "abcdefabcdefabcdefabcdefabcdefabcdefabcd";
    meta.remote_url = "git@github.com:owner/repo.git";
    const gitferry::Envelope env{gitferry::describe_source(work / "x.bundle"),
                                 gitferry::describe_source(work / "x.patch"), meta};
    const gitferry::AlignedRegionReader reader;
    const gitferry::ChunkGenerator gen(env, reader, 512);

    gitferry::UploadRegistry registry;
    gitferry::remote::LocalRemote local(store);
    gitferry::TransferSession session(*registry.try_acquire("agent-7"), gen, local);
    session.run();

    const auto agent_dir = store / "agent-7";
    if (gitferry::fs::read_file(agent_dir / gitferry::consts::kBundleFile) != bundle ||
        gitferry::fs::read_file(agent_dir / gitferry::consts::kPatchFile) != patch) {
      std::cerr << "extracted artifacts differ from the originals\n";
      return 1;
    }
    if (session.finalize_result().bundle_size != bundle.size() ||
        session.finalize_result().patch_size != patch.size()) {
      std::cerr << "finalize reported wrong sizes\n";
      return 1;
    }
    const auto meta_bytes = gitferry::fs::read_file(agent_dir / gitferry::consts::kMetadataFile);
    const auto doc = nlohmann::json::parse(std::string(meta_bytes.begin(), meta_bytes.end()));
    if (doc.at("baseCommitSha") != *meta.base_commit_sha ||
        doc.at("remoteUrl") != *meta.remote_url || doc.at("isIncremental") != true) {
      std::cerr << "metadata file mismatch: " << doc.dump() << "\n";
      return 1;
    }
    for (const auto &entry : stdfs::directory_iterator(agent_dir)) {
      const auto name = entry.path().filename().string();
      if (name.starts_with(gitferry::consts::kChunkPrefix) ||
          name == gitferry::consts::kTotalFile) {
        std::cerr << "chunk state left behind: " << name << "\n";
        return 1;
      }
    }
    if (local.query_progress("agent-7").has_value()) {
      std::cerr << "finished upload still reports progress\n";
      return 1;
    }

    // Finalize again answers with the extracted sizes
    const auto again = local.finalize("agent-7");
    if (again.bundle_size != bundle.size() || again.patch_size != patch.size()) {
      std::cerr << "repeated finalize changed the answer\n";
      return 1;
    }

    gitferry::UploadReceiver receiver(store);

    // Contiguous prefix and duplicate delivery
    if (receiver.chunks_received("agent-8")) {
      std::cerr << "unknown agent has progress\n";
      return 1;
    }
    if (receiver.store_chunk("agent-8", 0, 4, "aa") != 1 ||
        receiver.store_chunk("agent-8", 2, 4, "cc") != 1 ||
        receiver.store_chunk("agent-8", 0, 4, "aa") != 1 ||
        receiver.store_chunk("agent-8", 1, 4, "bb") != 3) {
      std::cerr << "received count is not the contiguous prefix\n";
      return 1;
    }
    if (receiver.chunks_received("agent-8") != 3u) {
      std::cerr << "chunks_received disagrees with store_chunk\n";
      return 1;
    }
    if (!throws<std::runtime_error>([&] { (void)receiver.finalize("agent-8"); })) {
      std::cerr << "incomplete upload finalized\n";
      return 1;
    }
    if (receiver.chunks_received("agent-8") != 3u) {
      std::cerr << "incomplete finalize dropped received chunks\n";
      return 1;
    }

    // Different total: rejected mid-upload, restarts from index 0
    if (!throws<std::runtime_error>([&] { (void)receiver.store_chunk("agent-8", 3, 9, "zz"); })) {
      std::cerr << "mismatched total accepted mid-upload\n";
      return 1;
    }
    if (receiver.store_chunk("agent-8", 0, 2, "new") != 1 ||
        receiver.chunks_received("agent-8") != 1u) {
      std::cerr << "index 0 with a new total did not restart the upload\n";
      return 1;
    }
    if (!throws<std::runtime_error>([&] { (void)receiver.store_chunk("agent-8", 2, 2, "x"); })) {
      std::cerr << "index past total accepted\n";
      return 1;
    }

    // Garbage envelope: finalize fails and clears the chunks
    (void)receiver.store_chunk("agent-9", 0, 2, "{\"bundleBase64\":");
    (void)receiver.store_chunk("agent-9", 1, 2, "\"not base64!\",\"patchBase64\":\"\"}");
    if (!throws<std::runtime_error>([&] { (void)receiver.finalize("agent-9"); })) {
      std::cerr << "invalid base64 accepted\n";
      return 1;
    }
    if (receiver.chunks_received("agent-9")) {
      std::cerr << "chunks kept after a rejected envelope\n";
      return 1;
    }

    // Full upload writes no metadata file
    (void)receiver.store_chunk("agent-10", 0, 1,
                               "{\"bundleBase64\":\"QUJD\",\"patchBase64\":\"\","
                               "\"isIncremental\":false}");
    const auto res = receiver.finalize("agent-10");
    if (res.bundle_size != 3 || res.patch_size != 0 ||
        gitferry::fs::exists(store / "agent-10" / gitferry::consts::kMetadataFile)) {
      std::cerr << "full upload extraction wrong\n";
      return 1;
    }

    // Agent ids are single path components
    for (const char *bad : {"", ".", "..", "a/b", "../x", "a b"}) {
      if (!throws<std::runtime_error>([&] { (void)receiver.agent_dir(bad); })) {
        std::cerr << "agent id '" << bad << "' accepted\n";
        return 1;
      }
    }
    if (!throws<gitferry::TransportError>([&] { (void)local.query_progress("../etc"); })) {
      std::cerr << "local remote did not wrap the error\n";
      return 1;
    }

    std::cout << "receiver_store OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    stdfs::remove_all(dir);
    return 1;
  }
  std::error_code ec;
  stdfs::remove_all(dir, ec);
  return 0;
}
