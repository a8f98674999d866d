#pragma once
#include "gitferry/binary_source.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gitferry {

// Fixed at session start; rendered into the envelope's literal suffix.
struct EnvelopeMetadata {
  bool is_incremental = false;
  std::optional<std::string> base_commit_sha;
  std::optional<std::string> remote_url;
};

// `","isIncremental":<bool>[,"baseCommitSha":"..."][,"remoteUrl":"..."]}` (pure ASCII).
// Throws std::runtime_error on invalid UTF-8.
auto envelope_suffix(const EnvelopeMetadata& meta) -> std::string;

// Literal envelope text; points into the owning Envelope.
struct LiteralSlice {
  std::string_view text;
};

// Base64 character range [start, end) of one binary source.
struct BinarySlice {
  const BinarySource* source;
  std::uint64_t start;
  std::uint64_t end;
};

using Slice = std::variant<LiteralSlice, BinarySlice>;

class LiteralSegment {
public:
  explicit LiteralSegment(std::string text) : text_(std::move(text)) {}

  [[nodiscard]] auto length() const -> std::uint64_t { return text_.size(); }
  [[nodiscard]] auto resolve(std::uint64_t local_start, std::uint64_t local_end) const -> Slice;
  [[nodiscard]] const std::string& text() const { return text_; }

private:
  std::string text_;
};

class BinarySegment {
public:
  explicit BinarySegment(BinarySource source) : source_(std::move(source)) {}

  [[nodiscard]] auto length() const -> std::uint64_t { return source_.base64_length(); }
  [[nodiscard]] auto resolve(std::uint64_t local_start, std::uint64_t local_end) const -> Slice;
  [[nodiscard]] const BinarySource& source() const { return source_; }

private:
  BinarySource source_;
};

using Segment = std::variant<LiteralSegment, BinarySegment>;

/**
 * The virtual JSON document
 *   prefix | base64(bundle) | middle | base64(patch) | suffix
 * described as an ordered segment list. Nothing is encoded up front; resolve()
 * maps an envelope byte range to literal text and binary sub-requests.
 * Slices returned by resolve() refer into this object.
 */
class Envelope {
public:
  // Throws std::runtime_error if a metadata string is not valid UTF-8.
  Envelope(BinarySource bundle, BinarySource patch, EnvelopeMetadata metadata);

  [[nodiscard]] auto total_length() const -> std::uint64_t { return total_length_; }
  [[nodiscard]] const EnvelopeMetadata& metadata() const { return metadata_; }
  [[nodiscard]] const std::vector<Segment>& segments() const { return segments_; }

  // Split [start, end) into per-segment slices, in order. Empty parts are skipped.
  // Throws OutOfRangeError if start > end or end > total_length().
  [[nodiscard]] auto resolve(std::uint64_t start, std::uint64_t end) const -> std::vector<Slice>;

private:
  EnvelopeMetadata metadata_;
  std::vector<Segment> segments_;
  std::uint64_t total_length_ = 0;
};

} // namespace gitferry
