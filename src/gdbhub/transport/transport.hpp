#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace gdbhub {

// One accepted client connection. read and write return the byte count,
// 0 at end of stream and a negative value on error.
class transport {
public:
  virtual ~transport() = default;

  virtual bool readable(std::chrono::milliseconds timeout) = 0;
  virtual std::ptrdiff_t read(std::span<std::byte> out) = 0;
  virtual std::ptrdiff_t write(std::span<const std::byte> data) = 0;
  virtual std::string peer_name() const = 0;
  virtual void close() = 0;
};

class listener {
public:
  virtual ~listener() = default;

  virtual bool listen(std::string_view address) = 0;
  // Null when nothing arrived within the timeout.
  virtual std::unique_ptr<transport> accept(std::chrono::milliseconds timeout) = 0;
  virtual std::optional<uint16_t> local_port() const = 0;
  virtual void close() = 0;
};

} // namespace gdbhub
