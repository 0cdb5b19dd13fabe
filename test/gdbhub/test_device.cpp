#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "gdbhub/device/device.hpp"
#include "gdbhub/protocol/framing.hpp"
#include "gdbhub/protocol/tags.hpp"

#include "fake_bridge.hpp"
#include "test_util.hpp"

using namespace std::chrono_literals;
using gdbhub::call_status;
using gdbhub::device_mode;
using gdbhub::device_state;
using gdbhub::test::bytes;
using gdbhub::test::fake_line;
using gdbhub::test::wait_until;

namespace {

gdbhub::hub_config test_config() {
  gdbhub::hub_config config;
  config.start_servers = false;
  config.metadata_timeout = 500ms;
  config.dispatch_timeout = 1000ms;
  config.hub_call_timeout = 1000ms;
  config.boot_reply_timeout = 1000ms;
  config.app_reply_timeout = 1000ms;
  config.ping_timeout = 1000ms;
  return config;
}

gdbhub::device_info test_device(bool app_running) {
  return gdbhub::device_info{
      .id = {"lab", "/dev/ttyACM0", false},
      .tty = "/dev/ttyACM0",
      .tcp_port = 0,
      .app_running = app_running,
  };
}

std::string slip(std::string_view frame) { return gdbhub::framing::slip_encode(frame); }

std::string tagged(uint16_t tag, std::string_view body) { return gdbhub::tags::encode(tag) + std::string(body); }

struct device_fixture {
  gdbhub::test::fake_spawner spawner;
  std::shared_ptr<gdbhub::device_actor> actor;

  explicit device_fixture(fake_line::responder respond,
                          bool app_running = false,
                          gdbhub::device_hooks hooks = {},
                          gdbhub::hub_config config = test_config())
      : spawner(std::move(respond)) {
    actor = gdbhub::device_actor::start(test_device(app_running), std::move(config), spawner, std::move(hooks));
  }

  ~device_fixture() {
    actor->stop();
    actor->exited().wait();
  }

  bool ready() {
    return wait_until([&] { return actor->state() == device_state::ready; });
  }

  std::shared_ptr<fake_line> line() {
    wait_until([&] { return spawner.line(0) != nullptr; });
    return spawner.line(0);
  }

  gdbhub::device_record record() {
    auto dumped = actor->dump(1000ms);
    REQUIRE(dumped.has_value());
    return *dumped;
  }
};

// Collects frames handed to a packet handler.
struct frame_sink {
  std::mutex mutex;
  std::vector<std::string> frames;

  gdbhub::packet_handler handler() {
    return [this](gdbhub::device_actor&, std::string_view frame) {
      std::lock_guard<std::mutex> lock(mutex);
      frames.emplace_back(frame);
    };
  }

  bool received(const std::string& frame) {
    return wait_until([&] {
      std::lock_guard<std::mutex> lock(mutex);
      for (const auto& seen : frames) {
        if (seen == frame) {
          return true;
        }
      }
      return false;
    });
  }
};

// [{123, <<"hello">>}]
std::string log_term() {
  return bytes({131, 108, 0, 0, 0, 1, 104, 2, 97, 123, 109, 0, 0, 0, 5, 'h', 'e', 'l', 'l', 'o', 106});
}

} // namespace

TEST_CASE("boot loader negotiates metadata and reports ready") {
  std::atomic<bool> up{false};
  gdbhub::device_hooks hooks;
  hooks.on_up = [&](const std::shared_ptr<gdbhub::device_actor>&) { up = true; };

  gdbhub::test::device_meta meta;
  meta.protocol = "{packet,2}";
  meta.protocol2 = "slip";
  device_fixture device(gdbhub::test::boot_loader(meta), false, hooks);
  REQUIRE(device.ready());
  CHECK(wait_until([&] { return up.load(); }));

  auto record = device.record();
  REQUIRE(record.uid.has_value());
  CHECK(*record.uid == "0123456789ABCDEF");
  CHECK(record.decode_protocol == "slip");
  CHECK(record.encode_protocol == "{packet,2}");
  CHECK(record.mode == device_mode::bootloader);
  CHECK(record.tty == "/dev/ttyACM0");
  CHECK_FALSE(record.server_port.has_value());

  auto requests = device.spawner.requests();
  REQUIRE(requests.size() == 1);
  CHECK(requests[0].host == "lab");
  CHECK(requests[0].command == "gdbstub_connect");
  REQUIRE(requests[0].args.size() == 1);
  CHECK(requests[0].args[0] == "/dev/ttyACM0");
}

TEST_CASE("missing metadata still leaves the device usable") {
  gdbhub::test::log_capture logs;
  auto config = test_config();
  config.metadata_timeout = 100ms;
  device_fixture device({}, false, {}, config);
  REQUIRE(device.ready());

  auto record = device.record();
  CHECK_FALSE(record.uid.has_value());
  CHECK(record.decode_protocol == "raw");
  CHECK(record.encode_protocol == "raw");
  CHECK(logs.contains("error getting meta info"));
}

TEST_CASE("boot loader ack is answered empty without traffic") {
  device_fixture device(gdbhub::test::boot_loader());
  REQUIRE(device.ready());

  auto before = device.line()->writes().size();
  auto result = device.actor->rsp_call("+", 1000ms);
  CHECK(result.ok());
  CHECK(result.reply.empty());
  CHECK(device.line()->writes().size() == before);
  CHECK(device.actor->mode() == device_mode::bootloader);
}

TEST_CASE("boot loader reply is assembled from chunks") {
  device_fixture device(gdbhub::test::boot_loader({}, [](fake_line& line, std::string_view written) {
    if (written == "$g#67") {
      line.push("+$12");
      line.push("34#ca");
    }
  }));
  REQUIRE(device.ready());

  auto result = device.actor->rsp_call("$g#67", 1000ms);
  REQUIRE(result.ok());
  CHECK(result.reply == "+$1234#ca");
  CHECK(device.actor->mode() == device_mode::bootloader);
}

TEST_CASE("boot loader call times out without a reply") {
  auto config = test_config();
  config.boot_reply_timeout = 100ms;
  device_fixture device(gdbhub::test::boot_loader(), false, {}, config);
  REQUIRE(device.ready());

  auto result = device.actor->rsp_call("$g#67", 2000ms);
  CHECK(result.status == call_status::timeout);
  CHECK(device.actor->alive());
  CHECK_FALSE(device.record().debug_call_pending);
}

TEST_CASE("second debug call while one is waiting ends the actor") {
  device_fixture device(gdbhub::test::boot_loader());
  REQUIRE(device.ready());

  auto first = std::async(std::launch::async, [&] { return device.actor->rsp_call("$g#67", 2000ms); });
  REQUIRE(device.line()->wait_written("$g#67"));

  auto second = device.actor->rsp_call("$?#3f", 2000ms);
  CHECK(second.status == call_status::terminated);
  CHECK(first.get().status == call_status::terminated);

  auto reason = device.actor->exited().get();
  CHECK(reason.find("rsp_call") != std::string::npos);
  CHECK(device.actor->state() == device_state::terminated);
}

TEST_CASE("application answers correlated calls") {
  device_fixture device(gdbhub::test::slip_application({}, gdbhub::test::echo_calls), true);
  REQUIRE(device.ready());

  auto record = device.record();
  CHECK(record.mode == device_mode::application);
  CHECK(record.decode_protocol == "slip");
  CHECK(record.encode_protocol == "slip");

  auto result = device.actor->call("ping", 1000ms);
  REQUIRE(result.ok());
  CHECK(result.reply == "pong");
  CHECK(device.line()->wait_written(slip(tagged(gdbhub::tags::gdb, "ping" + bytes({3, 131, 97, 0})))));

  CHECK(device.actor->ping(1000ms));
  CHECK(device.record().pending_calls == 0);
}

TEST_CASE("application debug requests travel on the gdb channel") {
  device_fixture device(gdbhub::test::slip_application({}, [](fake_line& line, std::string_view frame) {
                          if (frame == tagged(gdbhub::tags::gdb, "$g#67")) {
                            line.push(slip(tagged(gdbhub::tags::gdb, "+$12")));
                            line.push(slip(tagged(gdbhub::tags::gdb, "34#ca")));
                          }
                        }),
                        true);
  REQUIRE(device.ready());

  auto result = device.actor->rsp_call("$g#67", 1000ms);
  REQUIRE(result.ok());
  CHECK(result.reply == "+$1234#ca");

  auto ack = device.actor->rsp_call("+", 1000ms);
  CHECK(ack.ok());
  CHECK(ack.reply.empty());
  CHECK(device.line()->wait_written(slip(tagged(gdbhub::tags::gdb, "+"))));
}

TEST_CASE("second debug call in the application ends the actor") {
  device_fixture device(gdbhub::test::slip_application(), true);
  REQUIRE(device.ready());

  auto first = std::async(std::launch::async, [&] { return device.actor->rsp_call("$g#67", 2000ms); });
  REQUIRE(device.line()->wait_written(slip(tagged(gdbhub::tags::gdb, "$g#67"))));

  auto second = device.actor->rsp_call("$?#3f", 2000ms);
  CHECK(second.status == call_status::terminated);
  CHECK(first.get().status == call_status::terminated);

  auto reason = device.actor->exited().get();
  CHECK(reason.find("rsp_call") != std::string::npos);
  CHECK(device.actor->state() == device_state::terminated);
}

TEST_CASE("unanswered calls time out") {
  device_fixture device(gdbhub::test::slip_application(), true);
  REQUIRE(device.ready());

  auto result = device.actor->call("x", 100ms);
  CHECK(result.status == call_status::timeout);
  CHECK(device.record().pending_calls == 0);
}

TEST_CASE("calls that cannot be framed fail") {
  gdbhub::test::device_meta meta;
  meta.protocol = "{packet,1}";
  device_fixture device(gdbhub::test::boot_loader(meta), false);
  REQUIRE(device.ready());

  auto result = device.actor->call(std::string(300, 'x'), 1000ms);
  CHECK(result.status == call_status::error);
  CHECK(device.actor->mode() == device_mode::bootloader);
  CHECK(device.record().pending_calls == 0);
}

TEST_CASE("stray replies are logged") {
  gdbhub::test::log_capture logs;
  device_fixture device(gdbhub::test::slip_application(), true);
  REQUIRE(device.ready());

  device.line()->push(slip(tagged(gdbhub::tags::reply, bytes({3, 131, 97, 9}))));
  CHECK(logs.wait_for("reply 9 received by no one"));

  device.line()->push(slip(tagged(gdbhub::tags::reply, "")));
  CHECK(logs.wait_for("bad ack in reply"));
}

TEST_CASE("info channel is logged line by line") {
  gdbhub::test::log_capture logs;
  device_fixture device(gdbhub::test::slip_application(), true);
  REQUIRE(device.ready());

  device.line()->push(slip(tagged(gdbhub::tags::info, "hello\nwor")));
  CHECK(logs.wait_for("info: hello"));
  CHECK(device.record().line_buffer == "wor");

  device.line()->push(slip(tagged(gdbhub::tags::info, "ld\n")));
  CHECK(logs.wait_for("info: world"));
  CHECK(device.record().line_buffer.empty());
}

TEST_CASE("info text without newlines is flushed when it grows too long") {
  gdbhub::test::log_capture logs;
  device_fixture device(gdbhub::test::slip_application(), true);
  REQUIRE(device.ready());

  device.line()->push(slip(tagged(gdbhub::tags::info, std::string(3000, 'a'))));
  REQUIRE(wait_until([&] { return device.record().line_buffer.size() == 3000; }));
  device.line()->push(slip(tagged(gdbhub::tags::info, std::string(1500, 'b'))));
  CHECK(logs.wait_for("info: aaaa"));
  CHECK(device.record().line_buffer.empty());

  device.line()->push(slip(tagged(gdbhub::tags::info, "tail\n")));
  CHECK(logs.wait_for("info: tail"));
}

TEST_CASE("gdb frames without a waiter are logged") {
  gdbhub::test::log_capture logs;
  device_fixture device(gdbhub::test::slip_application(), true);
  REQUIRE(device.ready());

  device.line()->push(slip(tagged(gdbhub::tags::gdb, "$T05#b9")));
  CHECK(logs.wait_for("from_gdbstub: $T05#b9"));
}

TEST_CASE("forward handler takes unclaimed frames first") {
  frame_sink forwarded;
  frame_sink fallback;
  gdbhub::device_hooks hooks;
  hooks.default_handler = fallback.handler();

  device_fixture device(gdbhub::test::slip_application(), true, hooks);
  REQUIRE(device.ready());
  device.actor->set_forward(forwarded.handler());
  CHECK(device.record().has_forward);

  device.line()->push(slip("abc"));
  CHECK(forwarded.received("abc"));
  std::lock_guard<std::mutex> lock(fallback.mutex);
  CHECK(fallback.frames.empty());
}

TEST_CASE("default handler sees unclaimed frames") {
  frame_sink fallback;
  gdbhub::device_hooks hooks;
  hooks.default_handler = fallback.handler();

  device_fixture device(gdbhub::test::slip_application(), true, hooks);
  REQUIRE(device.ready());

  device.line()->push(slip("abc"));
  CHECK(fallback.received("abc"));
}

TEST_CASE("linked peers relay unclaimed frames") {
  device_fixture a(gdbhub::test::slip_application(), true);
  device_fixture b(gdbhub::test::slip_application(), true);
  REQUIRE(a.ready());
  REQUIRE(b.ready());

  gdbhub::link_peers(a.actor, b.actor);
  CHECK(a.record().has_peer);
  CHECK(b.record().has_peer);

  a.line()->push(slip("xyz"));
  CHECK(b.line()->wait_written("xyz"));
}

TEST_CASE("unclaimed frames are printed") {
  gdbhub::test::log_capture logs;
  device_fixture device(gdbhub::test::slip_application(), true);
  REQUIRE(device.ready());

  device.line()->push(slip(log_term()));
  CHECK(logs.wait_for("term: hello"));

  device.line()->push(slip("abc"));
  CHECK(logs.wait_for("packet: abc"));
}

TEST_CASE("framing errors drop the buffered bytes") {
  gdbhub::test::log_capture logs;
  device_fixture device(gdbhub::test::slip_application(), true);
  REQUIRE(device.ready());

  device.line()->push(bytes({0xc0, 'a', 'b'}));
  CHECK(device.record().rest_size == 3);

  device.line()->push(bytes({0xdb, 0x01}));
  CHECK(logs.wait_for("framing error"));
  CHECK(device.record().rest_size == 0);
  CHECK(device.actor->alive());
}

TEST_CASE("sending raw data starts the application") {
  device_fixture device(gdbhub::test::boot_loader());
  REQUIRE(device.ready());
  CHECK(device.actor->mode() == device_mode::bootloader);

  device.actor->send("hi");
  CHECK(device.line()->wait_written("hi"));
  CHECK(wait_until([&] { return device.actor->mode() == device_mode::application; }));
}

TEST_CASE("send_packet frames through the encoder") {
  device_fixture device(gdbhub::test::slip_application(), true);
  REQUIRE(device.ready());

  device.actor->send_packet("abc");
  CHECK(device.line()->wait_written(slip("abc")));

  device.actor->set_name("left");
  auto record = device.record();
  REQUIRE(record.name.has_value());
  CHECK(*record.name == "left");
}

TEST_CASE("terms are written with a 4-byte length") {
  device_fixture device(gdbhub::test::boot_loader());
  REQUIRE(device.ready());

  namespace term = gdbhub::term;
  device.actor->send_term(term::make_tuple({term::make_atom("ok"), term::make_integer(1)}));
  CHECK(device.line()->wait_written(bytes({0, 0, 0, 9, 131, 104, 2, 119, 2, 'o', 'k', 97, 1})));
  CHECK(device.actor->mode() == device_mode::bootloader);
  CHECK(device.actor->alive());
}

TEST_CASE("bridge exit terminates the actor") {
  std::string exit_reason;
  std::mutex exit_mutex;
  gdbhub::device_hooks hooks;
  hooks.on_exit = [&](const gdbhub::device_actor&, const std::string& reason) {
    std::lock_guard<std::mutex> lock(exit_mutex);
    exit_reason = reason;
  };

  device_fixture device(gdbhub::test::boot_loader(), false, hooks);
  REQUIRE(device.ready());

  device.line()->exit(3);
  CHECK(device.actor->exited().get() == "bridge exited (3)");
  CHECK(device.actor->state() == device_state::terminated);
  CHECK(device.line()->closed());
  {
    std::lock_guard<std::mutex> lock(exit_mutex);
    CHECK(exit_reason == "bridge exited (3)");
  }

  CHECK(device.actor->rsp_call("+", 100ms).status == call_status::terminated);
  CHECK_FALSE(device.actor->dump(100ms).has_value());
}

TEST_CASE("spawn failure terminates the actor") {
  gdbhub::test::fake_spawner spawner;
  spawner.fail_spawns();
  auto actor = gdbhub::device_actor::start(test_device(false), test_config(), spawner, {});
  CHECK(actor->exited().get() == "bridge spawn failed");
  CHECK_FALSE(actor->alive());
  CHECK(spawner.spawn_count() == 1);
}

TEST_CASE("stop reports its reason") {
  device_fixture device(gdbhub::test::boot_loader());
  REQUIRE(device.ready());

  device.actor->stop("removed");
  CHECK(device.actor->exited().get() == "removed");
}
