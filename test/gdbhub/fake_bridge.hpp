#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gdbhub/bridge/bridge.hpp"
#include "gdbhub/protocol/framing.hpp"
#include "gdbhub/protocol/rsp_core.hpp"
#include "gdbhub/protocol/tags.hpp"

namespace gdbhub::test {

// In-memory serial line. The responder plays the device: it sees every
// write and may push data back.
class fake_line {
public:
  using responder = std::function<void(fake_line&, std::string_view written)>;

  explicit fake_line(responder respond = {}) : respond_(std::move(respond)) {}

  void start(bridge_events events) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_ = std::move(events);
  }

  bool write(std::string_view data) {
    responder respond;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_ || fail_writes_) {
        return false;
      }
      written_.append(data.data(), data.size());
      writes_.emplace_back(data);
      respond = respond_;
    }
    cv_.notify_all();
    if (respond) {
      respond(*this, data);
    }
    return true;
  }

  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    events_ = {};
  }

  // Device to host.
  void push(std::string data) {
    std::function<void(std::string)> on_data;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      on_data = events_.on_data;
    }
    if (on_data) {
      on_data(std::move(data));
    }
  }

  void exit(int status) {
    std::function<void(int)> on_exit;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      on_exit = events_.on_exit;
    }
    if (on_exit) {
      on_exit(status);
    }
  }

  void set_responder(responder respond) {
    std::lock_guard<std::mutex> lock(mutex_);
    respond_ = std::move(respond);
  }

  void fail_writes() {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_writes_ = true;
  }

  std::string written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
  }

  std::vector<std::string> writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  bool wait_written(std::string_view needle, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return written_.find(needle) != std::string::npos; });
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bridge_events events_;
  responder respond_;
  std::string written_;
  std::vector<std::string> writes_;
  bool closed_ = false;
  bool fail_writes_ = false;
};

class fake_channel final : public bridge_channel {
public:
  explicit fake_channel(std::shared_ptr<fake_line> line) : line_(std::move(line)) {}

  void start(bridge_events events) override { line_->start(std::move(events)); }
  bool write(std::string_view data) override { return line_->write(data); }
  void close() override { line_->close(); }

private:
  std::shared_ptr<fake_line> line_;
};

// Hands out a fresh line per spawn, all sharing one responder.
class fake_spawner final : public bridge_spawner {
public:
  explicit fake_spawner(fake_line::responder respond = {}) : respond_(std::move(respond)) {}

  std::unique_ptr<bridge_channel> spawn(const spawn_request& request) override {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    if (fail_) {
      return nullptr;
    }
    auto line = std::make_shared<fake_line>(respond_);
    lines_.push_back(line);
    return std::make_unique<fake_channel>(std::move(line));
  }

  void fail_spawns() {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_ = true;
  }

  size_t spawn_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
  }

  std::vector<spawn_request> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  std::shared_ptr<fake_line> line(size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index < lines_.size() ? lines_[index] : nullptr;
  }

private:
  mutable std::mutex mutex_;
  fake_line::responder respond_;
  std::vector<spawn_request> requests_;
  std::vector<std::shared_ptr<fake_line>> lines_;
  bool fail_ = false;
};

struct device_meta {
  std::string uid = "0123456789ABCDEF";
  std::string protocol = "raw";
  std::string protocol2 = "unknown";
};

inline std::optional<std::string> meta_answer(const device_meta& meta, std::string_view command) {
  if (command == "uid") {
    return meta.uid;
  }
  if (command == "protocol") {
    return meta.protocol;
  }
  if (command == "protocol2") {
    return meta.protocol2;
  }
  return std::nullopt;
}

// A boot loader: answers monitor queries in plain RSP and delegates the
// rest to `other`.
inline fake_line::responder boot_loader(device_meta meta = {}, fake_line::responder other = {}) {
  return [meta = std::move(meta), other = std::move(other)](fake_line& line, std::string_view written) {
    if (auto command = rsp::parse_monitor_command(written)) {
      if (auto answer = meta_answer(meta, *command)) {
        line.push(rsp::wrap(rsp::encode_hex(*answer)));
        return;
      }
    }
    if (other) {
      other(line, written);
    }
  };
}

// A running application speaking SLIP with tagged frames: answers monitor
// queries on the gdb sub-channel and hands every other frame to `other`.
inline fake_line::responder slip_application(device_meta meta = {},
                                             std::function<void(fake_line&, std::string_view frame)> other = {}) {
  meta.protocol = "slip";
  return [meta = std::move(meta), other = std::move(other)](fake_line& line, std::string_view written) {
    auto decoded = framing::slip_decode(written);
    if (decoded.status != framing::decode_status::frame) {
      return;
    }
    std::string_view frame = decoded.frame;
    if (tags::peek(frame) == tags::gdb) {
      if (auto command = rsp::parse_monitor_command(frame.substr(tags::tag_size))) {
        if (auto answer = meta_answer(meta, *command)) {
          line.push(framing::slip_encode(tags::encode(tags::gdb) + rsp::wrap(rsp::encode_hex(*answer))));
          return;
        }
      }
    }
    if (other) {
      other(line, frame);
    }
  };
}

// Answers correlated calls by echoing the ack. Calls with payload "ping"
// get "pong", everything else an empty reply.
inline void echo_calls(fake_line& line, std::string_view frame) {
  if (frame.size() < tags::tag_size + 4) {
    return;
  }
  auto ack = frame.substr(frame.size() - 4);
  auto payload = frame.substr(tags::tag_size, frame.size() - tags::tag_size - 4);
  std::string reply = tags::encode(tags::reply);
  reply.append(ack.data(), ack.size());
  if (payload == "ping") {
    reply += "pong";
  }
  line.push(framing::slip_encode(reply));
}

} // namespace gdbhub::test
