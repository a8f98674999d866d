#include "gitferry/receiver.hpp"

#include "gitferry/base64.hpp"
#include "gitferry/consts.hpp"
#include "gitferry/errors.hpp"
#include "gitferry/fs.hpp"
#include "gitferry/util.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <system_error>

namespace stdfs = std::filesystem;
namespace gfs = gitferry::fs;

namespace {

stdfs::path chunk_path(const stdfs::path &dir, std::uint64_t index) {
  return dir / (std::string(gitferry::consts::kChunkPrefix) + std::to_string(index));
}

std::optional<std::uint64_t> read_total(const stdfs::path &dir) {
  const auto path = dir / gitferry::consts::kTotalFile;
  if (!gfs::exists(path)) {
    return std::nullopt;
  }
  const auto bytes = gfs::read_file(path);
  std::string text(bytes.begin(), bytes.end());
  gitferry::strutil::rstrip_newlines(text);
  const auto total = gitferry::parse_u64(text);
  if (!total) {
    throw std::runtime_error("corrupt upload state: " + path.string());
  }
  return total;
}

void write_total(const stdfs::path &dir, std::uint64_t total) {
  const std::string s = std::to_string(total) + "\n";
  gfs::write_file_atomic(dir / gitferry::consts::kTotalFile, gfs::as_bytes(s));
}

std::uint64_t contiguous_chunks(const stdfs::path &dir, std::uint64_t total) {
  std::uint64_t n = 0;
  while (n < total && gfs::exists(chunk_path(dir, n))) {
    ++n;
  }
  return n;
}

// Drop every chunk file and the recorded total; keeps extracted artifacts.
void clear_chunks(const stdfs::path &dir) {
  std::error_code ec;
  if (!stdfs::exists(dir, ec)) {
    return;
  }
  for (const auto &entry : stdfs::directory_iterator(dir)) {
    const std::string name = entry.path().filename().string();
    if (name.starts_with(gitferry::consts::kChunkPrefix) ||
        name == gitferry::consts::kTotalFile) {
      gfs::remove_file(entry.path());
    }
  }
}

std::uint64_t file_size_or_zero(const stdfs::path &p) {
  std::error_code ec;
  const auto n = stdfs::file_size(p, ec);
  return ec ? 0 : static_cast<std::uint64_t>(n);
}

} // namespace

namespace gitferry {

stdfs::path UploadReceiver::agent_dir(std::string_view agent_id) const {
  if (!is_valid_agent_id(agent_id)) {
    throw std::runtime_error("invalid agent id: '" + std::string(agent_id) + "'");
  }
  return root_ / std::string(agent_id);
}

std::optional<std::uint64_t> UploadReceiver::chunks_received(std::string_view agent_id) const {
  const auto dir = agent_dir(agent_id);
  const auto total = read_total(dir);
  if (!total) {
    return std::nullopt;
  }
  return contiguous_chunks(dir, *total);
}

std::uint64_t UploadReceiver::store_chunk(std::string_view agent_id, std::uint64_t index,
                                          std::uint64_t total_chunks, std::string_view data) {
  if (index >= total_chunks) {
    throw std::runtime_error("chunk index " + std::to_string(index) + " out of range (" +
                             std::to_string(total_chunks) + " chunks)");
  }
  const auto dir = agent_dir(agent_id);
  const auto recorded = read_total(dir);
  if (recorded && *recorded != total_chunks) {
    if (index != 0) {
      throw std::runtime_error("totalChunks mismatch: upload in progress has " +
                               std::to_string(*recorded) + " chunks");
    }
    clear_chunks(dir);
  }
  if (!recorded || *recorded != total_chunks) {
    write_total(dir, total_chunks);
  }

  gfs::write_file_atomic(
      chunk_path(dir, index),
      std::span(reinterpret_cast<const std::uint8_t *>(data.data()), data.size()));
  return contiguous_chunks(dir, total_chunks);
}

FinalizeResult UploadReceiver::finalize(std::string_view agent_id) {
  const auto dir = agent_dir(agent_id);
  const auto bundle_out = dir / consts::kBundleFile;
  const auto patch_out = dir / consts::kPatchFile;

  const auto total = read_total(dir);
  if (!total) {
    // Already finalized: answer again with what was extracted
    if (gfs::exists(bundle_out) && gfs::exists(patch_out)) {
      return FinalizeResult{.bundle_size = file_size_or_zero(bundle_out),
                            .patch_size = file_size_or_zero(patch_out)};
    }
    throw std::runtime_error("no upload chunks found");
  }
  const std::uint64_t have = contiguous_chunks(dir, *total);
  if (have != *total) {
    throw std::runtime_error("upload incomplete: " + std::to_string(have) + "/" +
                             std::to_string(*total) + " chunks");
  }

  std::string combined;
  for (std::uint64_t i = 0; i < *total; ++i) {
    const auto bytes = gfs::read_file(chunk_path(dir, i));
    combined.append(bytes.begin(), bytes.end());
  }

  std::vector<std::uint8_t> bundle;
  std::vector<std::uint8_t> patch;
  nlohmann::json doc;
  bool incremental = false;
  try {
    doc = nlohmann::json::parse(combined);
    bundle = base64_decode(doc.at("bundleBase64").get<std::string>());
    patch = base64_decode(doc.at("patchBase64").get<std::string>());
    incremental = doc.value("isIncremental", false);
  } catch (const nlohmann::json::exception &e) {
    clear_chunks(dir);
    throw std::runtime_error(std::string("envelope is not valid: ") + e.what());
  } catch (const std::runtime_error &e) {
    clear_chunks(dir);
    throw std::runtime_error(std::string("envelope payload is not valid base64: ") + e.what());
  }
  combined.clear();

  gfs::write_file_atomic(bundle_out, bundle);
  gfs::write_file_atomic(patch_out, patch);

  if (incremental && doc.contains("baseCommitSha") && doc.contains("remoteUrl")) {
    const nlohmann::json meta = {{"isIncremental", true},
                                 {"baseCommitSha", doc["baseCommitSha"]},
                                 {"remoteUrl", doc["remoteUrl"]}};
    gfs::write_file_atomic(dir / consts::kMetadataFile, gfs::as_bytes(meta.dump()));
  }

  clear_chunks(dir);
  return FinalizeResult{.bundle_size = bundle.size(), .patch_size = patch.size()};
}

namespace remote {

std::optional<std::uint64_t> LocalRemote::query_progress(const std::string &agent_id) {
  try {
    return receiver_.chunks_received(agent_id);
  } catch (const std::exception &e) {
    throw TransportError(std::string("progress: ") + e.what());
  }
}

void LocalRemote::submit_chunk(const std::string &agent_id, const ChunkUpload &chunk) {
  try {
    (void)receiver_.store_chunk(agent_id, chunk.index, chunk.total_chunks, chunk.data);
  } catch (const std::exception &e) {
    throw TransportError("chunk " + std::to_string(chunk.index) + ": " + e.what());
  }
}

FinalizeResult LocalRemote::finalize(const std::string &agent_id) {
  try {
    return receiver_.finalize(agent_id);
  } catch (const std::exception &e) {
    throw TransportError(std::string("finalize: ") + e.what());
  }
}

} // namespace remote

} // namespace gitferry
