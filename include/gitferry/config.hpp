#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace gitferry {

struct Settings {
  std::string host;                  // receiver host for tcp uploads
  int port = 0;                      // receiver port
  std::uint64_t chunk_size = 0;      // envelope bytes per chunk
  std::filesystem::path store;       // receiver store root
};

// Defaults for a working directory (store under <dir>/.gitferry/uploads)
auto default_settings(const std::filesystem::path& dir) -> Settings;

// Positive decimal no larger than the receiver's per-chunk limit
// (consts::kMaxChunkBytes). Throws std::runtime_error otherwise.
auto parse_chunk_size(std::string_view text) -> std::uint64_t;

auto settings_path(const std::filesystem::path& dir) -> std::filesystem::path;

// Read <dir>/.gitferry/config over the defaults. Missing file -> defaults.
// Throws std::runtime_error on an invalid value.
auto load_settings(const std::filesystem::path& dir) -> Settings;

// Overwrite <dir>/.gitferry/config with the given settings
void save_settings(const std::filesystem::path& dir, const Settings& settings);

} // namespace gitferry
