#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitferry {

/**
 * Number of base64 characters for `byte_length` input bytes:
 *   ceil(byte_length / 3) * 4
 * Always a multiple of 4 (the final group carries '=' padding).
 */
constexpr std::uint64_t base64_length(std::uint64_t byte_length) {
  return ((byte_length + 2) / 3) * 4;
}

/** Standard-alphabet base64 with '=' padding. */
std::string base64_encode(std::span<const std::uint8_t> data);

/**
 * Decode standard base64. Throws std::runtime_error if the input length is not
 * a multiple of 4 or contains characters outside the alphabet.
 */
std::vector<std::uint8_t> base64_decode(std::string_view text);

} // namespace gitferry
