#include "gitferry/envelope.hpp"

#include "gitferry/consts.hpp"
#include "gitferry/errors.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

// JSON string literal, quotes included, non-ASCII escaped. Throws std::runtime_error
// on invalid UTF-8.
std::string json_string(std::string_view field, const std::string &s) {
  try {
    return nlohmann::json(s).dump(-1, ' ', /*ensure_ascii=*/true);
  } catch (const nlohmann::json::type_error &e) {
    throw std::runtime_error("envelope metadata: " + std::string(field) +
                             " is not valid UTF-8 (" + e.what() + ")");
  }
}

auto segment_length(const gitferry::Segment &seg) -> std::uint64_t {
  return std::visit([](const auto &s) { return s.length(); }, seg);
}

} // namespace

namespace gitferry {

std::string envelope_suffix(const EnvelopeMetadata &meta) {
  std::string s = "\",\"isIncremental\":";
  s += meta.is_incremental ? "true" : "false";
  if (meta.base_commit_sha) {
    s += ",\"baseCommitSha\":" + json_string("baseCommitSha", *meta.base_commit_sha);
  }
  if (meta.remote_url) {
    s += ",\"remoteUrl\":" + json_string("remoteUrl", *meta.remote_url);
  }
  s += "}";
  return s;
}

Slice LiteralSegment::resolve(std::uint64_t local_start, std::uint64_t local_end) const {
  if (local_start > local_end || local_end > text_.size()) {
    throw OutOfRangeError("literal segment: range outside segment");
  }
  return LiteralSlice{std::string_view(text_).substr(local_start, local_end - local_start)};
}

Slice BinarySegment::resolve(std::uint64_t local_start, std::uint64_t local_end) const {
  if (local_start > local_end || local_end > source_.base64_length()) {
    throw OutOfRangeError("binary segment: range outside segment");
  }
  return BinarySlice{.source = &source_, .start = local_start, .end = local_end};
}

Envelope::Envelope(BinarySource bundle, BinarySource patch, EnvelopeMetadata metadata)
    : metadata_(std::move(metadata)) {
  segments_.reserve(5);
  segments_.emplace_back(LiteralSegment{std::string(consts::kEnvelopePrefix)});
  segments_.emplace_back(BinarySegment{std::move(bundle)});
  segments_.emplace_back(LiteralSegment{std::string(consts::kEnvelopeMiddle)});
  segments_.emplace_back(BinarySegment{std::move(patch)});
  segments_.emplace_back(LiteralSegment{envelope_suffix(metadata_)});
  for (const auto &seg : segments_) {
    total_length_ += segment_length(seg);
  }
}

std::vector<Slice> Envelope::resolve(std::uint64_t start, std::uint64_t end) const {
  if (start > end || end > total_length_) {
    throw OutOfRangeError("envelope: range [" + std::to_string(start) + ", " +
                          std::to_string(end) + ") outside length " +
                          std::to_string(total_length_));
  }
  std::vector<Slice> out;
  std::uint64_t offset = 0;
  for (const auto &seg : segments_) {
    const std::uint64_t seg_end = offset + segment_length(seg);
    const std::uint64_t lo = std::max(start, offset);
    const std::uint64_t hi = std::min(end, seg_end);
    if (lo < hi) {
      out.push_back(std::visit([&](const auto &s) { return s.resolve(lo - offset, hi - offset); },
                               seg));
    }
    if (seg_end >= end) {
      break;
    }
    offset = seg_end;
  }
  return out;
}

} // namespace gitferry
