#include "gdbhub/transport/transport_tcp.hpp"

#include <array>
#include <charconv>
#include <optional>
#include <string>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <fmt/core.h>

#include "gdbhub/log.hpp"
#include "gdbhub/posix/fd_handle.hpp"

namespace gdbhub {

namespace {

using posix::fd_handle;

struct bind_target {
  std::string host; // empty binds every interface
  std::string port;
};

// Splits a listen address. The port must be a decimal number in range.
std::optional<bind_target> split_listen_address(std::string_view address) {
  std::string_view host;
  std::string_view port = address;

  if (address.starts_with('[')) {
    auto close = address.find("]:");
    if (close == std::string_view::npos) {
      return std::nullopt;
    }
    host = address.substr(1, close - 1);
    port = address.substr(close + 2);
  } else if (auto colon = address.find(':'); colon != std::string_view::npos) {
    if (address.find(':', colon + 1) != std::string_view::npos) {
      return std::nullopt; // bare v6 literals need brackets
    }
    host = address.substr(0, colon);
    port = address.substr(colon + 1);
  }

  unsigned value = 0;
  auto [end, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
  if (port.empty() || ec != std::errc{} || end != port.data() + port.size() || value > 65535) {
    return std::nullopt;
  }
  if (host == "*") {
    host = {};
  }
  return bind_target{std::string(host), std::string(port)};
}

struct addrinfo_list {
  addrinfo* head = nullptr;
  ~addrinfo_list() {
    if (head != nullptr) {
      freeaddrinfo(head);
    }
  }
};

std::optional<uint16_t> port_of(const sockaddr_storage& addr) {
  switch (addr.ss_family) {
  case AF_INET:
    return ntohs(reinterpret_cast<const sockaddr_in&>(addr).sin_port);
  case AF_INET6:
    return ntohs(reinterpret_cast<const sockaddr_in6&>(addr).sin6_port);
  default:
    return std::nullopt;
  }
}

std::string peer_text(int fd) {
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  std::array<char, NI_MAXHOST> host{};
  if (getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0 ||
      getnameinfo(reinterpret_cast<sockaddr*>(&addr), len, host.data(), host.size(), nullptr, 0, NI_NUMERICHOST) !=
          0) {
    return "?";
  }
  auto port = port_of(addr);
  return addr.ss_family == AF_INET6 ? fmt::format("[{}]:{}", host.data(), port.value_or(0))
                                    : fmt::format("{}:{}", host.data(), port.value_or(0));
}

class tcp_connection final : public transport {
public:
  explicit tcp_connection(fd_handle fd) : fd_(std::move(fd)), peer_(peer_text(fd_.get())) {
    int on = 1;
    setsockopt(fd_.get(), IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on));
  }

  bool readable(std::chrono::milliseconds timeout) override {
    return fd_ && posix::wait_readable(fd_.get(), timeout) == posix::wait_result::ready;
  }

  std::ptrdiff_t read(std::span<std::byte> out) override {
    if (!fd_) {
      return -1;
    }
    return out.empty() ? 0 : recv(fd_.get(), out.data(), out.size(), 0);
  }

  std::ptrdiff_t write(std::span<const std::byte> data) override {
    if (!fd_) {
      return -1;
    }
    return data.empty() ? 0 : send(fd_.get(), data.data(), data.size(), MSG_NOSIGNAL);
  }

  std::string peer_name() const override { return peer_; }

  void close() override { fd_.close(); }

private:
  fd_handle fd_;
  std::string peer_;
};

} // namespace

class tcp_listener::impl {
public:
  bool listen(std::string_view address) {
    fd_.close();

    auto target = split_listen_address(address);
    if (!target) {
      log::warn("bad listen address '{}'", address);
      return false;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    addrinfo_list candidates;
    const char* node = target->host.empty() ? nullptr : target->host.c_str();
    if (int rc = getaddrinfo(node, target->port.c_str(), &hints, &candidates.head); rc != 0) {
      log::warn("cannot resolve '{}': {}", address, gai_strerror(rc));
      return false;
    }

    for (auto* ai = candidates.head; ai != nullptr; ai = ai->ai_next) {
      fd_handle fd(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
      if (!fd) {
        continue;
      }
      int on = 1;
      setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
      if (::bind(fd.get(), ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd.get(), SOMAXCONN) == 0) {
        fd_ = std::move(fd);
        return true;
      }
    }
    return false;
  }

  std::unique_ptr<transport> accept(std::chrono::milliseconds timeout) {
    if (!fd_ || posix::wait_readable(fd_.get(), timeout) != posix::wait_result::ready) {
      return nullptr;
    }
    fd_handle client(::accept4(fd_.get(), nullptr, nullptr, SOCK_CLOEXEC));
    if (!client) {
      return nullptr;
    }
    return std::make_unique<tcp_connection>(std::move(client));
  }

  std::optional<uint16_t> local_port() const {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (!fd_ || getsockname(fd_.get(), reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      return std::nullopt;
    }
    return port_of(addr);
  }

  void close() { fd_.close(); }

private:
  fd_handle fd_;
};

tcp_listener::tcp_listener() : impl_(std::make_unique<impl>()) {}
tcp_listener::~tcp_listener() = default;

tcp_listener::tcp_listener(tcp_listener&&) noexcept = default;
tcp_listener& tcp_listener::operator=(tcp_listener&&) noexcept = default;

bool tcp_listener::listen(std::string_view address) { return impl_->listen(address); }
std::unique_ptr<transport> tcp_listener::accept(std::chrono::milliseconds timeout) { return impl_->accept(timeout); }
std::optional<uint16_t> tcp_listener::local_port() const { return impl_->local_port(); }
void tcp_listener::close() { impl_->close(); }

} // namespace gdbhub
