#include "gitferry/region_reader.hpp"

#include "gitferry/consts.hpp"
#include "gitferry/errors.hpp"
#include "gitferry/fs.hpp"

#include <algorithm>
#include <stdexcept>

namespace {

using gitferry::consts::kBase64Group;
using gitferry::consts::kBinaryGroup;

constexpr std::uint64_t align_down(std::uint64_t x) { return x / kBase64Group * kBase64Group; }
constexpr std::uint64_t align_up(std::uint64_t x) {
  return (x + kBase64Group - 1) / kBase64Group * kBase64Group;
}
constexpr std::uint64_t to_binary(std::uint64_t b64) { return b64 / kBase64Group * kBinaryGroup; }

} // namespace

namespace gitferry {

std::string read_range_base64(const std::filesystem::path &path, std::uint64_t offset,
                              std::size_t length) {
  return base64_encode(fs::read_range(path, offset, length));
}

std::string AlignedRegionReader::read(const BinarySource &source, std::uint64_t a,
                                      std::uint64_t b) const {
  const std::uint64_t b64_len = source.base64_length();
  if (a > b || b > b64_len) {
    throw OutOfRangeError("region reader: [" + std::to_string(a) + ", " + std::to_string(b) +
                          ") outside base64 length " + std::to_string(b64_len) + " of " +
                          source.path.string());
  }
  if (a == b) {
    return {};
  }

  const std::uint64_t aligned_start = align_down(a);
  const std::uint64_t aligned_end = std::min(align_up(b), b64_len);
  const std::uint64_t bin_start = to_binary(aligned_start);
  const std::uint64_t bin_end = std::min(to_binary(aligned_end), source.byte_length);

  const std::string encoded =
      read_(source.path, bin_start, static_cast<std::size_t>(bin_end - bin_start));

  const std::uint64_t local_start = a - aligned_start;
  const std::uint64_t local_end = b - aligned_start;
  if (encoded.size() < local_end) {
    throw std::runtime_error("artifact changed during transfer: " + source.path.string());
  }
  return encoded.substr(local_start, local_end - local_start);
}

} // namespace gitferry
