#pragma once
#include "gitferry/remote.hpp"

#include <string>
#include <string_view>

namespace gitferry {
class UploadReceiver;
}

namespace gitferry::tcpremote {

struct Endpoint {
  std::string host;
  int port;
};

// "tcp://host[:port]"; port defaults to consts::portNumber.
auto parse_url(std::string_view url) -> Endpoint;

// Client side of the `gitferry serve` protocol. One connection per request.
class TcpRemote : public UploadRemote {
public:
  explicit TcpRemote(Endpoint endpoint) : endpoint_(std::move(endpoint)) {}

  auto query_progress(const std::string& agent_id) -> std::optional<std::uint64_t> override;
  void submit_chunk(const std::string& agent_id, const ChunkUpload& chunk) override;
  auto finalize(const std::string& agent_id) -> FinalizeResult override;

  [[nodiscard]] const Endpoint& endpoint() const { return endpoint_; }

private:
  Endpoint endpoint_;
};

// Serve one request on a connected socket. Returns a one-line summary for logging.
auto serve_connection(int fd, UploadReceiver& receiver) -> std::string;

} // namespace gitferry::tcpremote
