#include "gitferry/tcp_remote.hpp"

#include "gitferry/consts.hpp"
#include "gitferry/errors.hpp"
#include "gitferry/net.hpp"
#include "gitferry/receiver.hpp"
#include "gitferry/util.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace consts = gitferry::consts;

namespace {

// Connect, greet, send the op line (plus payload) and return the single reply line.
// "ERR <msg>" replies become TransportError.
[[nodiscard]] auto round_trip(const gitferry::tcpremote::Endpoint &ep, const std::string &op_line,
                              std::string_view payload = {}) -> std::string {
  std::string reply;
  try {
    auto sock = gitferry::net::connect_tcp(ep.host, ep.port);
    gitferry::net::send_line(sock.get(), consts::kHelloLine);
    gitferry::net::send_line(sock.get(), op_line);
    if (!payload.empty()) {
      gitferry::net::send_all(sock.get(), payload.data(), payload.size());
    }
    reply = gitferry::net::recv_line(sock.get());
  } catch (const std::exception &e) {
    throw gitferry::TransportError(e.what());
  }
  if (reply.starts_with(consts::kTokErr)) {
    throw gitferry::TransportError(reply.substr(consts::kTokErr.size()));
  }
  return reply;
}

// Split "OK a b" into {"a", "b"}; throws if the reply is not OK.
[[nodiscard]] auto ok_fields(const std::string &reply) -> std::vector<std::string> {
  std::istringstream is(reply);
  std::string tok;
  is >> tok;
  if (tok != consts::kTokOk) {
    throw gitferry::TransportError("unexpected reply: " + reply);
  }
  std::vector<std::string> out;
  while (is >> tok) {
    out.push_back(tok);
  }
  return out;
}

[[nodiscard]] auto field_u64(const std::vector<std::string> &fields, std::size_t i,
                             const std::string &reply) -> std::uint64_t {
  if (i >= fields.size()) {
    throw gitferry::TransportError("malformed reply: " + reply);
  }
  const auto v = gitferry::parse_u64(fields[i]);
  if (!v) {
    throw gitferry::TransportError("malformed reply: " + reply);
  }
  return *v;
}

// Single line, no CR/LF, for ERR replies
[[nodiscard]] auto one_line(std::string s) -> std::string {
  std::ranges::replace(s, '\n', ' ');
  std::ranges::replace(s, '\r', ' ');
  return s;
}

struct ChunkHeader {
  std::string agent;
  std::uint64_t index = 0;
  std::uint64_t total = 0;
  std::uint64_t length = 0;
};

// "<agent> <index> <total> <length>"
[[nodiscard]] auto parse_chunk_header(std::string_view rest) -> ChunkHeader {
  std::istringstream is{std::string(rest)};
  std::string agent, index, total, length, extra;
  if (!(is >> agent >> index >> total >> length) || (is >> extra)) {
    throw std::runtime_error("expected OP CHUNK <agent> <index> <total> <length>");
  }
  const auto i = gitferry::parse_u64(index);
  const auto t = gitferry::parse_u64(total);
  const auto n = gitferry::parse_u64(length);
  if (!i || !t || !n) {
    throw std::runtime_error("malformed OP CHUNK numbers");
  }
  return ChunkHeader{.agent = agent, .index = *i, .total = *t, .length = *n};
}

} // namespace

namespace gitferry::tcpremote {

Endpoint parse_url(std::string_view url) {
  constexpr std::string_view kScheme = "tcp://";
  if (!url.starts_with(kScheme)) {
    throw std::runtime_error("not a tcp:// url: " + std::string(url));
  }
  url.remove_prefix(kScheme.size());
  const auto colon = url.rfind(':');
  if (colon == std::string_view::npos) {
    return Endpoint{.host = std::string(url), .port = consts::portNumber};
  }
  const auto port = parse_u64(url.substr(colon + 1));
  if (!port || *port == 0 || *port > 65535) {
    throw std::runtime_error("bad port in url: " + std::string(url));
  }
  return Endpoint{.host = std::string(url.substr(0, colon)), .port = static_cast<int>(*port)};
}

std::optional<std::uint64_t> TcpRemote::query_progress(const std::string &agent_id) {
  const std::string reply = round_trip(endpoint_, std::string(consts::kOpProgress) + agent_id);
  if (!reply.starts_with(consts::kTokProgress)) {
    throw TransportError("unexpected reply: " + reply);
  }
  const std::string_view value = std::string_view(reply).substr(consts::kTokProgress.size());
  if (value == consts::kTokNone) {
    return std::nullopt;
  }
  const auto n = parse_u64(value);
  if (!n) {
    throw TransportError("malformed reply: " + reply);
  }
  return *n;
}

void TcpRemote::submit_chunk(const std::string &agent_id, const ChunkUpload &chunk) {
  std::ostringstream op;
  op << consts::kOpChunk << agent_id << ' ' << chunk.index << ' ' << chunk.total_chunks << ' '
     << chunk.data.size();
  const std::string reply = round_trip(endpoint_, op.str(), chunk.data);
  (void)field_u64(ok_fields(reply), 0, reply);
}

FinalizeResult TcpRemote::finalize(const std::string &agent_id) {
  const std::string reply = round_trip(endpoint_, std::string(consts::kOpFinalize) + agent_id);
  const auto fields = ok_fields(reply);
  return FinalizeResult{.bundle_size = field_u64(fields, 0, reply),
                        .patch_size = field_u64(fields, 1, reply)};
}

std::string serve_connection(int fd, UploadReceiver &receiver) {
  std::string op;
  try {
    if (net::recv_line(fd) != consts::kHelloLine) {
      net::send_line(fd, std::string(consts::kTokErr) + "bad hello");
      return "rejected: bad hello";
    }
    op = net::recv_line(fd);

    if (op.starts_with(consts::kOpProgress)) {
      const std::string agent = op.substr(consts::kOpProgress.size());
      const auto n = receiver.chunks_received(agent);
      net::send_line(fd, std::string(consts::kTokProgress) +
                             (n ? std::to_string(*n) : std::string(consts::kTokNone)));
      return "progress " + agent + ": " + (n ? std::to_string(*n) : "none");
    }

    if (op.starts_with(consts::kOpChunk)) {
      const auto hdr = parse_chunk_header(std::string_view(op).substr(consts::kOpChunk.size()));
      if (hdr.length > consts::kMaxChunkBytes) {
        throw std::runtime_error("chunk too large: " + std::to_string(hdr.length) + " bytes");
      }
      std::string data(static_cast<std::size_t>(hdr.length), '\0');
      net::recv_exact(fd, reinterpret_cast<std::uint8_t *>(data.data()), data.size());
      const auto received = receiver.store_chunk(hdr.agent, hdr.index, hdr.total, data);
      net::send_line(fd, std::string(consts::kTokOk) + " " + std::to_string(received));
      return "chunk " + hdr.agent + " " + std::to_string(hdr.index + 1) + "/" +
             std::to_string(hdr.total) + " (" + std::to_string(received) + " received)";
    }

    if (op.starts_with(consts::kOpFinalize)) {
      const std::string agent = op.substr(consts::kOpFinalize.size());
      const auto res = receiver.finalize(agent);
      net::send_line(fd, std::string(consts::kTokOk) + " " + std::to_string(res.bundle_size) +
                             " " + std::to_string(res.patch_size));
      return "finalize " + agent + ": bundle " + format_bytes(res.bundle_size) + ", patch " +
             format_bytes(res.patch_size);
    }

    net::send_line(fd, std::string(consts::kTokErr) + "unknown op");
    return "rejected: unknown op '" + op + "'";
  } catch (const std::exception &e) {
    net::send_line(fd, std::string(consts::kTokErr) + one_line(e.what()));
    return "error: " + one_line(e.what());
  }
}

} // namespace gitferry::tcpremote
