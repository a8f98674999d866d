#include "gitferry/net.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <netdb.h>
#include <netinet/in.h>
#include <sstream>
#include <stdexcept>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace {

[[nodiscard]] auto gai_error_to_exception(int rc, std::string_view where, std::string_view host,
                                          int port) -> std::runtime_error {
  std::ostringstream os;
  os << where << " failed for " << host << ":" << port << ": " << gai_strerror(rc);
  return std::runtime_error(os.str());
}

} // namespace

namespace gitferry::net {

void UniqueFd::close_if_open() noexcept {
  if (fd_ != -1) {
    // best effort; no throw in destructor
    ::close(fd_);
    fd_ = -1;
  }
}

UniqueFd connect_tcp(const std::string &host, int port) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo *res = nullptr;
  const std::string port_s = std::to_string(port);

  if (const int rc = ::getaddrinfo(host.c_str(), port_s.c_str(), &hints, &res); rc != 0) {
    throw gai_error_to_exception(rc, "getaddrinfo", host, port);
  }

  UniqueFd sock;
  int saved_errno = 0;
  for (addrinfo *rp = res; rp != nullptr; rp = rp->ai_next) {
    const int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (fd == -1) {
      saved_errno = errno;
      continue;
    }
    if (::connect(fd, rp->ai_addr, rp->ai_addrlen) == 0) {
      sock.reset(fd);
      break;
    }
    saved_errno = errno;
    ::close(fd);
  }
  ::freeaddrinfo(res);

  if (!sock) {
    throw std::system_error(saved_errno, std::generic_category(),
                            "connect " + host + ":" + port_s);
  }
  return sock;
}

UniqueFd listen_tcp(int port, int backlog) {
  UniqueFd sock{::socket(AF_INET6, SOCK_STREAM, 0)};
  if (!sock) {
    throw std::system_error(errno, std::generic_category(), "socket");
  }
  int yes = 1;
  ::setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
  int no = 0;
  ::setsockopt(sock.get(), IPPROTO_IPV6, IPV6_V6ONLY, &no, sizeof(no));

  sockaddr_in6 addr{};
  addr.sin6_family = AF_INET6;
  addr.sin6_addr = in6addr_any;
  addr.sin6_port = htons(static_cast<std::uint16_t>(port));
  if (::bind(sock.get(), reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    throw std::system_error(errno, std::generic_category(), "bind");
  }
  if (::listen(sock.get(), backlog) != 0) {
    throw std::system_error(errno, std::generic_category(), "listen");
  }
  return sock;
}

void send_all(int fd, const void *buf, std::size_t n) {
  const auto *p = static_cast<const std::uint8_t *>(buf);
  while (n != 0U) {
    const ssize_t w = ::send(fd, p, n, MSG_NOSIGNAL);
    if (w <= 0) {
      throw std::system_error(errno, std::generic_category(), "send");
    }
    p += static_cast<std::size_t>(w);
    n -= static_cast<std::size_t>(w);
  }
}

void send_line(int fd, std::string_view s) {
  std::string t(s);
  t.push_back('\n');
  send_all(fd, t.data(), t.size());
}

void recv_exact(int fd, std::uint8_t *dst, std::size_t n) {
  std::size_t got = 0;
  while (got < n) {
    const ssize_t r = ::recv(fd, dst + got, n - got, 0);
    if (r == 0) {
      throw std::runtime_error("recv: connection closed");
    }
    if (r < 0) {
      throw std::system_error(errno, std::generic_category(), "recv");
    }
    got += static_cast<std::size_t>(r);
  }
}

std::string recv_line(int fd, std::size_t max_len) {
  std::string s;
  char c = '\0';
  for (;;) {
    const ssize_t r = ::recv(fd, &c, 1, 0);
    if (r == 0) {
      throw std::runtime_error("recv: connection closed");
    }
    if (r < 0) {
      throw std::system_error(errno, std::generic_category(), "recv");
    }
    if (c == '\n') {
      break;
    }
    if (s.size() >= max_len) {
      throw std::runtime_error("recv: line too long");
    }
    s.push_back(c);
  }
  if (!s.empty() && s.back() == '\r') {
    s.pop_back();
  }
  return s;
}

} // namespace gitferry::net
