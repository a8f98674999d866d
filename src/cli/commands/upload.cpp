#include "cli/options.hpp"
#include "gitferry/artifacts.hpp"
#include "gitferry/chunker.hpp"
#include "gitferry/config.hpp"
#include "gitferry/consts.hpp"
#include "gitferry/region_reader.hpp"
#include "gitferry/remote.hpp"
#include "gitferry/session.hpp"
#include "gitferry/util.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void print_progress(const gitferry::ProgressSnapshot &p) {
  std::cout << "\r[" << (p.is_full_bundle ? "full" : "incremental") << "] " << p.percentage
            << "% " << gitferry::format_bytes(p.loaded_bytes) << " / "
            << gitferry::format_bytes(p.total_bytes) << std::flush;
}

} // namespace

int cmd_upload(const gitferry::cli::Options &opts) {
  const std::string agent = opts.positional[0];

  try {
    const auto settings = gitferry::load_settings(std::filesystem::current_path());

    gitferry::ArtifactSet artifacts;
    artifacts.bundle_path = opts.positional[1];
    artifacts.patch_path = opts.positional[2];
    if (opts.has("--incremental")) {
      artifacts.is_incremental = true;
      artifacts.base_commit_sha = opts.values.at("--incremental");
      if (!gitferry::looks_hex40(*artifacts.base_commit_sha)) {
        std::cerr << "upload: warning: base commit is not a 40-hex sha; sending full bundle\n";
      }
    }
    if (opts.has("--remote-url")) {
      artifacts.remote_url = opts.values.at("--remote-url");
    }

    std::uint64_t chunk_size = settings.chunk_size;
    if (opts.has("--chunk-size")) {
      try {
        chunk_size = gitferry::parse_chunk_size(opts.values.at("--chunk-size"));
      } catch (const std::runtime_error &e) {
        std::cerr << "upload: --chunk-size: " << e.what() << "\n";
        return 2;
      }
    }
    const std::string target =
        opts.has("--remote") ? opts.values.at("--remote")
                             : "tcp://" + settings.host + ":" + std::to_string(settings.port);

    const gitferry::Envelope envelope = gitferry::make_envelope(artifacts);
    const gitferry::AlignedRegionReader reader;
    const gitferry::ChunkGenerator generator(envelope, reader, chunk_size);
    auto remote = gitferry::open_remote(target);

    // Shared with other gitferry processes in this directory
    gitferry::UploadRegistry registry{std::filesystem::current_path() /
                                      gitferry::consts::kStateDir / gitferry::consts::kLocksDir};
    auto lease = registry.try_acquire(agent);
    if (!lease) {
      std::cerr << "upload: an upload for " << agent << " is already running\n";
      return 1;
    }

    std::cout << "Uploading " << gitferry::format_bytes(envelope.total_length()) << " in "
              << generator.plan().total_chunks() << " chunks to " << target << "\n";

    gitferry::TransferSession session(std::move(*lease), generator, *remote, print_progress);
    try {
      session.run();
    } catch (const std::exception &e) {
      std::cout << "\n";
      if (!session.resume_note().empty())
        std::cerr << "upload: warning: " << session.resume_note() << "\n";
      std::cerr << "upload: failed at chunk " << session.next_chunk_index() << "/"
                << generator.plan().total_chunks() << ": " << e.what() << "\n";
      std::cerr << "upload: run the same command again to resume\n";
      return 1;
    }
    std::cout << "\n";
    if (!session.resume_note().empty())
      std::cerr << "upload: warning: " << session.resume_note() << "\n";
    if (session.resumed_from() > 0)
      std::cout << "Resumed from chunk " << session.resumed_from() << "\n";

    const auto &res = session.finalize_result();
    std::cout << "Uploaded " << agent << ": bundle " << gitferry::format_bytes(res.bundle_size)
              << ", patch " << gitferry::format_bytes(res.patch_size) << "\n";

    if (!opts.has("--keep")) {
      try {
        gitferry::remove_artifacts(artifacts);
      } catch (const std::exception &e) {
        std::cerr << "upload: warning: cleanup failed: " << e.what() << "\n";
      }
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "upload: " << e.what() << "\n";
    return 1;
  }
}
