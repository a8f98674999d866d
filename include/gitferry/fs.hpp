#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace gitferry::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

// Read at most `length` bytes starting at `offset`. Fewer bytes are returned only at EOF.
std::vector<std::uint8_t> read_range(const std::filesystem::path& p, std::uint64_t offset,
                                     std::size_t length);

// Remove a file; returns false if it did not exist. Throws on any other failure.
bool remove_file(const std::filesystem::path& p);

inline std::span<const std::uint8_t> as_bytes(const std::string& s) {
  return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

} // namespace gitferry::fs
