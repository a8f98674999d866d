#include "gitferry/binary_source.hpp"

#include "gitferry/errors.hpp"

#include <system_error>

namespace gitferry {

BinarySource describe_source(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw NotFoundError("artifact not found: " + path.string());
  }
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw NotFoundError("artifact unreadable: " + path.string() + ": " + ec.message());
  }
  return BinarySource{.path = path, .byte_length = static_cast<std::uint64_t>(size)};
}

} // namespace gitferry
