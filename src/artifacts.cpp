#include "gitferry/artifacts.hpp"

#include "gitferry/binary_source.hpp"
#include "gitferry/fs.hpp"
#include "gitferry/util.hpp"

namespace gitferry {

BundleDecision select_bundle_mode(const std::optional<std::string> &remote_url,
                                  RepoAccess access) {
  if (!remote_url || remote_url->empty()) {
    return BundleDecision{.mode = BundleMode::Incremental, .fallback_reason = {}};
  }
  switch (access) {
  case RepoAccess::Granted:
    return BundleDecision{.mode = BundleMode::Incremental, .fallback_reason = {}};
  case RepoAccess::None:
    return BundleDecision{.mode = BundleMode::Full,
                          .fallback_reason = "no access to " + *remote_url +
                                             "; uploading full bundle"};
  case RepoAccess::Unknown:
    break;
  }
  return BundleDecision{.mode = BundleMode::Full,
                        .fallback_reason = "could not check access to " + *remote_url +
                                           "; uploading full bundle"};
}

PreparedArtifacts prepare_artifacts(ArtifactProducer &producer,
                                    const std::filesystem::path &workdir,
                                    const std::optional<std::string> &remote_url,
                                    RepoAccess access) {
  BundleDecision decision = select_bundle_mode(remote_url, access);
  if (decision.mode == BundleMode::Full) {
    ArtifactSet set = producer.produce_full(workdir);
    // A full bundle carries no base commit and needs no remote clone
    set.is_incremental = false;
    set.base_commit_sha.reset();
    set.remote_url.reset();
    return PreparedArtifacts{.artifacts = std::move(set),
                             .fallback_reason = std::move(decision.fallback_reason)};
  }
  return PreparedArtifacts{.artifacts = producer.produce_incremental(workdir),
                           .fallback_reason = {}};
}

EnvelopeMetadata envelope_metadata(const ArtifactSet &artifacts) {
  EnvelopeMetadata meta;
  meta.is_incremental = artifacts.is_incremental && artifacts.base_commit_sha &&
                        looks_hex40(*artifacts.base_commit_sha);
  if (meta.is_incremental) {
    meta.base_commit_sha = artifacts.base_commit_sha;
  }
  if (artifacts.remote_url && !artifacts.remote_url->empty()) {
    meta.remote_url = artifacts.remote_url;
  }
  return meta;
}

Envelope make_envelope(const ArtifactSet &artifacts) {
  return Envelope{describe_source(artifacts.bundle_path), describe_source(artifacts.patch_path),
                  envelope_metadata(artifacts)};
}

void remove_artifacts(const ArtifactSet &artifacts) {
  fs::remove_file(artifacts.bundle_path);
  fs::remove_file(artifacts.patch_path);
}

} // namespace gitferry
