#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <span>
#include <string_view>

#include "gdbhub/transport/transport.hpp"

namespace gdbhub {

class tcp_listener final : public listener {
public:
  tcp_listener();
  ~tcp_listener() override;

  tcp_listener(tcp_listener&&) noexcept;
  tcp_listener& operator=(tcp_listener&&) noexcept;

  tcp_listener(const tcp_listener&) = delete;
  tcp_listener& operator=(const tcp_listener&) = delete;

  // "host:port", "[v6]:port", "*:port" or just "port". Port 0 binds an
  // ephemeral port, see local_port().
  bool listen(std::string_view address) override;
  std::unique_ptr<transport> accept(std::chrono::milliseconds timeout) override;
  std::optional<uint16_t> local_port() const override;
  void close() override;

private:
  class impl;
  std::unique_ptr<impl> impl_;
};

} // namespace gdbhub
