#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gitferry {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// Agent ids name directories and lock files: [A-Za-z0-9._-]+, not "." or ".."
auto is_valid_agent_id(std::string_view id) -> bool;

// Parse a whole string as an unsigned decimal; std::nullopt on any junk
auto parse_u64(std::string_view str) -> std::optional<std::uint64_t>;

// Human-readable byte count ("512 B", "1.50 MiB")
auto format_bytes(std::uint64_t n) -> std::string;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Trim spaces/tabs on both ends (and a trailing CR)
  auto trim(std::string_view sv) -> std::string;
}

}
