#include "gitferry/chunker.hpp"

#include "gitferry/errors.hpp"

#include <stdexcept>
#include <type_traits>

namespace gitferry {

ChunkPlan::ChunkPlan(std::uint64_t total, std::uint64_t size) : total_length(total), chunk_size(size) {
  if (chunk_size == 0) {
    throw std::invalid_argument("chunk size must be positive");
  }
}

// Offset after `count` whole chunks. count * chunk_size is only formed below
// total_length, so it cannot wrap.
std::uint64_t ChunkPlan::loaded_bytes(std::uint64_t count) const {
  return count >= total_chunks() ? total_length : count * chunk_size;
}

std::uint64_t ChunkPlan::chunk_start(std::uint64_t index) const { return loaded_bytes(index); }

std::uint64_t ChunkPlan::chunk_end(std::uint64_t index) const {
  return index >= total_chunks() ? total_length : loaded_bytes(index + 1);
}

ChunkGenerator::ChunkGenerator(const Envelope &envelope, const AlignedRegionReader &reader,
                               std::uint64_t chunk_size)
    : envelope_(envelope), reader_(reader), plan_(envelope.total_length(), chunk_size) {}

std::string ChunkGenerator::chunk(std::uint64_t index) const {
  if (index >= plan_.total_chunks()) {
    throw OutOfRangeError("chunk " + std::to_string(index) + " past last chunk (" +
                          std::to_string(plan_.total_chunks()) + " total)");
  }
  const std::uint64_t start = plan_.chunk_start(index);
  const std::uint64_t end = plan_.chunk_end(index);

  std::string out;
  out.reserve(static_cast<std::size_t>(end - start));
  for (const auto &slice : envelope_.resolve(start, end)) {
    std::visit(
        [&](const auto &s) {
          using T = std::decay_t<decltype(s)>;
          if constexpr (std::is_same_v<T, LiteralSlice>) {
            out.append(s.text);
          } else {
            out += reader_.read(*s.source, s.start, s.end);
          }
        },
        slice);
  }
  return out;
}

} // namespace gitferry
