#pragma once
#include "gitferry/base64.hpp"

#include <cstdint>
#include <filesystem>

namespace gitferry {

// An on-disk artifact embedded as base64 in the envelope.
struct BinarySource {
  std::filesystem::path path;
  std::uint64_t byte_length = 0;

  [[nodiscard]] auto base64_length() const -> std::uint64_t {
    return gitferry::base64_length(byte_length);
  }
};

// Stat `path` (no content read). Throws NotFoundError if it is missing or not a regular file.
auto describe_source(const std::filesystem::path& path) -> BinarySource;

} // namespace gitferry
