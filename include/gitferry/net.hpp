#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace gitferry::net {

// Owning wrapper around a socket descriptor.
class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) noexcept : fd_{fd} {}

  UniqueFd(const UniqueFd &) = delete;
  auto operator=(const UniqueFd &) -> UniqueFd & = delete;

  UniqueFd(UniqueFd &&other) noexcept : fd_{other.fd_} { other.fd_ = -1; }
  auto operator=(UniqueFd &&other) noexcept -> UniqueFd & {
    if (this != &other) {
      close_if_open();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  ~UniqueFd() { close_if_open(); }

  [[nodiscard]] auto valid() const noexcept -> bool { return fd_ != -1; }
  [[nodiscard]] explicit operator bool() const noexcept { return valid(); }
  [[nodiscard]] auto get() const noexcept -> int { return fd_; }

  void reset(int fd = -1) noexcept {
    if (fd_ != fd) {
      close_if_open();
      fd_ = fd;
    }
  }

private:
  int fd_{-1};

  void close_if_open() noexcept;
};

// Resolve and connect; throws std::runtime_error / std::system_error.
[[nodiscard]] auto connect_tcp(const std::string &host, int port) -> UniqueFd;

// Dual-stack listening socket on `port`.
[[nodiscard]] auto listen_tcp(int port, int backlog = 16) -> UniqueFd;

void send_all(int fd, const void *buf, std::size_t n);
void send_line(int fd, std::string_view s);
void recv_exact(int fd, std::uint8_t *dst, std::size_t n);

// Read up to '\n' (not included). Throws if the line exceeds `max_len`.
[[nodiscard]] auto recv_line(int fd, std::size_t max_len = 4096) -> std::string;

} // namespace gitferry::net
