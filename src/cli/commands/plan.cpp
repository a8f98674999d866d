#include "cli/options.hpp"
#include "gitferry/artifacts.hpp"
#include "gitferry/chunker.hpp"
#include "gitferry/config.hpp"
#include "gitferry/util.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>

int cmd_plan(const gitferry::cli::Options &opts) {
  try {
    const auto settings = gitferry::load_settings(std::filesystem::current_path());
    std::uint64_t chunk_size = settings.chunk_size;
    if (opts.has("--chunk-size")) {
      try {
        chunk_size = gitferry::parse_chunk_size(opts.values.at("--chunk-size"));
      } catch (const std::runtime_error &e) {
        std::cerr << "plan: --chunk-size: " << e.what() << "\n";
        return 2;
      }
    }

    gitferry::ArtifactSet artifacts;
    artifacts.bundle_path = opts.positional[0];
    artifacts.patch_path = opts.positional[1];
    if (opts.has("--incremental")) {
      artifacts.is_incremental = true;
      artifacts.base_commit_sha = opts.values.at("--incremental");
    }
    if (opts.has("--remote-url"))
      artifacts.remote_url = opts.values.at("--remote-url");

    const auto envelope = gitferry::make_envelope(artifacts);
    const gitferry::ChunkPlan plan(envelope.total_length(), chunk_size);

    for (const auto &seg : envelope.segments()) {
      if (const auto *bin = std::get_if<gitferry::BinarySegment>(&seg)) {
        std::cout << bin->source().path.string() << ": "
                  << gitferry::format_bytes(bin->source().byte_length) << " ("
                  << bin->source().base64_length() << " base64 chars)\n";
      }
    }
    std::cout << "envelope: " << envelope.total_length() << " bytes, "
              << (envelope.metadata().is_incremental ? "incremental" : "full bundle") << "\n";
    std::cout << "chunks:   " << plan.total_chunks() << " x " << plan.chunk_size << " bytes\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "plan: " << e.what() << "\n";
    return 1;
  }
}
