#pragma once
#include "gitferry/envelope.hpp"
#include "gitferry/region_reader.hpp"

#include <cstdint>
#include <string>

namespace gitferry {

// Chunk layout for an envelope. Depends only on (total_length, chunk_size).
struct ChunkPlan {
  std::uint64_t total_length = 0;
  std::uint64_t chunk_size = 0;

  // Throws std::invalid_argument if chunk_size is 0.
  ChunkPlan(std::uint64_t total, std::uint64_t size);

  [[nodiscard]] auto total_chunks() const -> std::uint64_t {
    return total_length / chunk_size + (total_length % chunk_size != 0 ? 1 : 0);
  }
  [[nodiscard]] auto chunk_start(std::uint64_t index) const -> std::uint64_t;
  [[nodiscard]] auto chunk_end(std::uint64_t index) const -> std::uint64_t;
  // Envelope bytes covered by the first `count` chunks.
  [[nodiscard]] auto loaded_bytes(std::uint64_t count) const -> std::uint64_t;
};

class ChunkGenerator {
public:
  ChunkGenerator(const Envelope& envelope, const AlignedRegionReader& reader,
                 std::uint64_t chunk_size);

  [[nodiscard]] const ChunkPlan& plan() const { return plan_; }
  [[nodiscard]] const Envelope& envelope() const { return envelope_; }

  // Envelope text of chunk `index`. Throws OutOfRangeError past the last chunk.
  [[nodiscard]] auto chunk(std::uint64_t index) const -> std::string;

private:
  const Envelope& envelope_;
  const AlignedRegionReader& reader_;
  ChunkPlan plan_;
};

} // namespace gitferry
