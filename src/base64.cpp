#include "gitferry/base64.hpp"

#include <climits>
#include <openssl/evp.h> // EVP_EncodeBlock / EVP_DecodeBlock
#include <stdexcept>

namespace gitferry {

std::string base64_encode(std::span<const std::uint8_t> data) {
  if (data.empty()) {
    return {};
  }
  if (data.size() > static_cast<std::size_t>(INT_MAX / 4 * 3)) {
    throw std::runtime_error("base64_encode: input too large");
  }
  // EVP_EncodeBlock writes a trailing NUL
  std::string out(static_cast<std::size_t>(base64_length(data.size())) + 1, '\0');
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()), data.data(),
                                static_cast<int>(data.size()));
  if (n < 0) {
    throw std::runtime_error("EVP_EncodeBlock failed");
  }
  out.resize(static_cast<std::size_t>(n));
  return out;
}

std::vector<std::uint8_t> base64_decode(std::string_view text) {
  if (text.empty()) {
    return {};
  }
  if (text.size() % 4 != 0 || text.size() > static_cast<std::size_t>(INT_MAX)) {
    throw std::runtime_error("base64_decode: bad input length");
  }
  std::vector<std::uint8_t> out(text.size() / 4 * 3);
  const int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char *>(text.data()),
                                static_cast<int>(text.size()));
  if (n < 0) {
    throw std::runtime_error("base64_decode: invalid character");
  }
  // EVP_DecodeBlock counts padding as zero bytes
  std::size_t pad = 0;
  if (text.back() == '=') {
    ++pad;
    if (text[text.size() - 2] == '=')
      ++pad;
  }
  out.resize(static_cast<std::size_t>(n) - pad);
  return out;
}

} // namespace gitferry
