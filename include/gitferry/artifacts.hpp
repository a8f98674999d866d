#pragma once
#include "gitferry/envelope.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace gitferry {

// Bundle + uncommitted patch produced for one upload. Treated as immutable until cleanup.
struct ArtifactSet {
  std::filesystem::path bundle_path;
  std::filesystem::path patch_path;
  bool is_incremental = false;
  std::optional<std::string> base_commit_sha;
  std::optional<std::string> remote_url;
};

// Result of the repository access check made before bundling.
enum class RepoAccess {
  Granted, // remote can clone the base itself
  None,    // no access to the remote repository
  Unknown  // the check failed
};

enum class BundleMode { Full, Incremental };

// Generates the artifacts (git bundle / diff). Implemented outside this library.
class ArtifactProducer {
public:
  virtual ~ArtifactProducer() = default;
  // Bundle of all refs.
  virtual auto produce_full(const std::filesystem::path& workdir) -> ArtifactSet = 0;
  // Bundle since the merge-base with the remote; may still report is_incremental = false.
  virtual auto produce_incremental(const std::filesystem::path& workdir) -> ArtifactSet = 0;
};

struct BundleDecision {
  BundleMode mode = BundleMode::Incremental;
  std::string fallback_reason; // non-empty when full bundling was forced
};

// No remote URL -> incremental; remote with Granted access -> incremental; otherwise full.
auto select_bundle_mode(const std::optional<std::string>& remote_url, RepoAccess access)
    -> BundleDecision;

struct PreparedArtifacts {
  ArtifactSet artifacts;
  std::string fallback_reason;
};

auto prepare_artifacts(ArtifactProducer& producer, const std::filesystem::path& workdir,
                       const std::optional<std::string>& remote_url, RepoAccess access)
    -> PreparedArtifacts;

// Metadata for the envelope suffix. An incremental set without a valid 40-hex
// base commit is sent as a full bundle.
auto envelope_metadata(const ArtifactSet& artifacts) -> EnvelopeMetadata;

// Stat both artifacts and build the envelope. Throws NotFoundError.
auto make_envelope(const ArtifactSet& artifacts) -> Envelope;

// Delete both artifacts (missing files are ignored). Throws std::runtime_error.
void remove_artifacts(const ArtifactSet& artifacts);

} // namespace gitferry
