#include "gitferry/remote.hpp"

#include "gitferry/receiver.hpp"
#include "gitferry/tcp_remote.hpp"

#include <stdexcept>

namespace gitferry {

std::unique_ptr<UploadRemote> open_remote(std::string_view url) {
  if (url.empty()) {
    throw std::runtime_error("empty remote");
  }
  if (url.starts_with("tcp://")) {
    return std::make_unique<tcpremote::TcpRemote>(tcpremote::parse_url(url));
  }
  return std::make_unique<remote::LocalRemote>(std::filesystem::path(url));
}

} // namespace gitferry
