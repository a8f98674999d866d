#pragma once
#include "gitferry/binary_source.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace gitferry {

// (path, byte offset, length) -> base64 of exactly that byte range.
using ReadPrimitive =
    std::function<std::string(const std::filesystem::path&, std::uint64_t, std::size_t)>;

// Default primitive: one positioned read of the file, encoded with OpenSSL.
auto read_range_base64(const std::filesystem::path& path, std::uint64_t offset,
                       std::size_t length) -> std::string;

/**
 * Serves base64 character ranges of a BinarySource without encoding the whole
 * file. A request [a, b) is widened to 4-character groups, which map to whole
 * 3-byte groups on disk, so one read of about (b - a) / 4 * 3 + 3 bytes is
 * enough regardless of file size.
 */
class AlignedRegionReader {
public:
  AlignedRegionReader() : read_(read_range_base64) {}
  explicit AlignedRegionReader(ReadPrimitive read) : read_(std::move(read)) {}

  // Exact base64 substring [a, b) of `source`. No read for an empty range.
  // Throws OutOfRangeError if a > b or b > source.base64_length().
  [[nodiscard]] auto read(const BinarySource& source, std::uint64_t a, std::uint64_t b) const
      -> std::string;

private:
  ReadPrimitive read_;
};

} // namespace gitferry
