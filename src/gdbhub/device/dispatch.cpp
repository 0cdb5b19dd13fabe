#include "gdbhub/device/device.hpp"

#include <fmt/core.h>

#include "gdbhub/log.hpp"
#include "gdbhub/protocol/term.hpp"

namespace gdbhub {

namespace {

// Info text without a newline is flushed once it reaches this size.
constexpr size_t k_max_info_line = 4096;

} // namespace

void device_actor::handle(bridge_data& msg) {
  if (boot_waiter_) {
    if (boot_waiter_->assembler.append(msg.data)) {
      auto waiter = std::move(*boot_waiter_);
      boot_waiter_.reset();
      waiter.reply->set_value(call_result::success(waiter.assembler.take()));
    }
    return;
  }
  decode_and_handle(msg.data);
}

void device_actor::handle(bridge_exit& msg) {
  log::error("bridge exited with status {}", msg.status);
  throw actor_exit(fmt::format("bridge exited ({})", msg.status));
}

// The bridge delivers an unsegmented byte stream; the decoder cuts it into
// frames and keeps the unfinished tail in rest_.
void device_actor::decode_and_handle(std::string_view data) {
  rest_.append(data.data(), data.size());
  while (true) {
    auto result = decoder_(rest_);
    switch (result.status) {
    case framing::decode_status::more:
      return;
    case framing::decode_status::error:
      log::warn("framing error ({}): {}", result.error, log::printable(rest_));
      rest_.clear();
      return;
    case framing::decode_status::frame:
      rest_ = std::move(result.rest);
      handle_frame(result.frame);
      break;
    }
  }
}

void device_actor::handle_frame(std::string_view frame) {
  if (frame.empty()) {
    return;
  }

  if (auto tag = tags::peek(frame)) {
    switch (*tag) {
    case tags::gdb:
      handle_gdb(frame.substr(tags::tag_size));
      return;
    case tags::info:
      handle_info(frame.substr(tags::tag_size));
      return;
    case tags::reply:
      handle_reply(frame);
      return;
    default:
      break;
    }
  }
  handle_unclaimed(frame);
}

void device_actor::handle_gdb(std::string_view body) {
  if (app_waiter_) {
    app_waiter_->chunks->post(std::string(body));
    return;
  }
  log::info("from_gdbstub: {}", log::printable(body));
}

void device_actor::handle_info(std::string_view body) {
  line_buffer_.append(body.data(), body.size());
  size_t newline;
  while ((newline = line_buffer_.find('\n')) != std::string::npos) {
    log::info("info: {}", log::printable(std::string_view(line_buffer_).substr(0, newline)));
    line_buffer_.erase(0, newline + 1);
  }
  if (line_buffer_.size() >= k_max_info_line) {
    log::info("info: {}", log::printable(line_buffer_));
    line_buffer_.clear();
  }
}

void device_actor::handle_unclaimed(std::string_view frame) {
  if (forward_) {
    forward_(*this, frame);
    return;
  }
  if (auto peer = peer_.lock()) {
    peer->send(std::string(frame));
    return;
  }
  if (hooks_.default_handler) {
    hooks_.default_handler(*this, frame);
    return;
  }
  print_frame(frame);
}

void device_actor::print_frame(std::string_view frame) {
  if (static_cast<unsigned char>(frame.front()) != term::version_magic) {
    log::info("packet: {}", log::printable(frame));
    return;
  }

  auto decoded = term::decode(frame);
  if (!decoded) {
    log::info("term decode failed: {}", log::printable(frame));
    return;
  }
  if (auto text = term::log_text(*decoded)) {
    log::info("term: {}", *text);
  } else {
    log::info("term: {}", term::to_string(*decoded));
  }
}

} // namespace gdbhub
