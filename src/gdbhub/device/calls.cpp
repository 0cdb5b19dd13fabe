#include "gdbhub/device/device.hpp"

#include <algorithm>
#include <limits>

#include <fmt/core.h>

#include "gdbhub/log.hpp"
#include "gdbhub/protocol/term.hpp"

namespace gdbhub {

namespace {

constexpr std::string_view k_ack_only = "+";

std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
  return std::max(left, std::chrono::milliseconds(0));
}

} // namespace

void device_actor::handle(rsp_call_request& msg) {
  if (mode() == device_mode::bootloader) {
    boot_call(msg);
  } else {
    app_call(msg);
  }
}

// The boot loader speaks plain RSP on the serial line; its reply is
// assembled straight from bridge data.
void device_actor::boot_call(rsp_call_request& msg) {
  if (boot_waiter_) {
    throw actor_exit("rsp_call while another one is waiting");
  }

  if (msg.request == k_ack_only) {
    msg.reply->set_value(call_result::success({}));
    return;
  }
  write_bridge(msg.request);

  auto deadline = std::min(msg.deadline, clock::now() + config_.boot_reply_timeout);
  boot_waiter_.emplace(boot_waiter{std::move(msg.reply), deadline, {}});
}

// The application multiplexes RSP over gdb-tagged frames; a helper thread
// collects the reply so the actor keeps serving other traffic.
void device_actor::app_call(rsp_call_request& msg) {
  if (app_waiter_) {
    throw actor_exit("rsp_call while another one is waiting");
  }

  auto serial = ++next_serial_;
  auto chunks = std::make_shared<mailbox<std::string>>();
  auto timeout = std::min(remaining(msg.deadline), config_.app_reply_timeout);

  app_waiter_.emplace();
  app_waiter_->serial = serial;
  app_waiter_->reply = std::move(msg.reply);
  app_waiter_->chunks = chunks;
  app_waiter_->helper = std::thread(&device_actor::app_call_helper, this, serial, std::move(msg.request), chunks, timeout);
}

void device_actor::app_call_helper(uint64_t serial,
                                   std::string request,
                                   std::shared_ptr<mailbox<std::string>> chunks,
                                   std::chrono::milliseconds timeout) {
  post(send_frame{tags::encode(tags::gdb) + request});

  if (request == k_ack_only) {
    post(rsp_call_reply{serial, std::string()});
    return;
  }

  auto deadline = clock::now() + timeout;
  rsp::assembler parser;
  std::optional<std::string> reply;
  while (!reply) {
    auto left = remaining(deadline);
    if (left.count() == 0) {
      break;
    }
    auto chunk = chunks->pop(left);
    if (!chunk) {
      if (chunks->closed()) {
        break;
      }
      continue;
    }
    if (parser.append(*chunk)) {
      reply = parser.take();
    }
  }
  post(rsp_call_reply{serial, std::move(reply)});
}

void device_actor::handle(rsp_call_reply& msg) {
  if (!app_waiter_ || app_waiter_->serial != msg.serial) {
    log::info("rsp reply received by no one: {}", log::printable(msg.reply.value_or("")));
    return;
  }

  auto waiter = std::move(*app_waiter_);
  app_waiter_.reset();
  waiter.chunks->close();
  if (waiter.helper.joinable()) {
    waiter.helper.join();
  }
  if (msg.reply) {
    waiter.reply->set_value(call_result::success(std::move(*msg.reply)));
  } else {
    log::warn("rsp_call timed out");
    waiter.reply->set_value(call_result::timed_out());
  }
}

// Frame: tag || payload || len(ack) || ack. The ack is the token as an
// external term, echoed back by the device in its reply.
void device_actor::handle(call_request& msg) {
  auto reply = msg.reply;
  auto id = calls_.allocate(pending_call{std::move(msg.reply), msg.deadline});
  auto ack = term::encode_integer(id);

  std::string frame = tags::encode(msg.tag);
  frame += msg.payload;
  frame.push_back(static_cast<char>(ack.size()));
  frame += ack;

  if (!write_frame(frame)) {
    calls_.resolve(id);
    reply->set_value(call_result::failed());
  }
}

void device_actor::handle_reply(std::string_view frame) {
  auto body = frame.substr(tags::tag_size);
  if (body.empty()) {
    log::warn("bad ack in reply: {}", log::printable(frame));
    return;
  }

  auto ack_size = static_cast<unsigned char>(body.front());
  if (body.size() < 1 + static_cast<size_t>(ack_size)) {
    log::warn("bad ack in reply: {}", log::printable(frame));
    return;
  }

  auto id = term::decode_integer(body.substr(1, ack_size));
  if (!id || *id < 0 || *id > std::numeric_limits<rpc::token>::max()) {
    log::warn("bad ack in reply: {}", log::printable(frame));
    return;
  }

  auto caller = calls_.resolve(static_cast<rpc::token>(*id));
  if (!caller) {
    log::info("reply {} received by no one", *id);
    return;
  }
  caller->reply->set_value(call_result::success(std::string(body.substr(1 + ack_size))));
}

void device_actor::handle(send_raw& msg) {
  write_bridge(msg.data);
  switch_to_application();
}

void device_actor::handle(send_frame& msg) {
  if (!write_frame(msg.frame)) {
    log::warn("dropping frame of {} bytes", msg.frame.size());
  }
}

// Term messages always use {packet,4}; the mode is left alone.
void device_actor::handle(send_term_request& msg) {
  auto framed = framing::length_encode(4, term::encode(msg.term));
  if (!framed) {
    log::warn("dropping term too large for a 4-byte length");
    return;
  }
  write_bridge(*framed);
}

bool device_actor::write_frame(std::string_view frame) {
  auto encoded = encoder_(frame);
  if (!encoded) {
    log::error("cannot encode frame as {}", framing::describe(encoder_.source()));
    return false;
  }
  write_bridge(*encoded);
  switch_to_application();
  return true;
}

// Anything sent that is not a debug request starts the application; there
// is no way back to the boot loader.
void device_actor::switch_to_application() {
  if (mode_.exchange(device_mode::application) == device_mode::bootloader) {
    log::info("switched to application mode");
  }
}

void device_actor::write_bridge(std::string_view data) {
  if (!bridge_ || !bridge_->write(data)) {
    log::error("bridge write failed");
    throw actor_exit("bridge write failed");
  }
}

void device_actor::expire_waiters() {
  auto now = clock::now();

  if (boot_waiter_ && boot_waiter_->deadline <= now) {
    log::warn("rsp_call timed out, partial reply: {}", log::printable(boot_waiter_->assembler.buffer()));
    boot_waiter_->reply->set_value(call_result::timed_out());
    boot_waiter_.reset();
  }

  calls_.erase_if([now](rpc::token id, pending_call& pending) {
    if (pending.deadline > now) {
      return false;
    }
    log::warn("call {} timed out", id);
    pending.reply->set_value(call_result::timed_out());
    return true;
  });
}

} // namespace gdbhub
