#include <doctest/doctest.h>

#include <string>
#include <string_view>
#include <variant>

#include "gdbhub/protocol/framing.hpp"

#include "test_util.hpp"

namespace framing = gdbhub::framing;
using gdbhub::test::bytes;

TEST_CASE("slip escapes terminators and escape bytes") {
  auto encoded = framing::slip_encode(bytes({'a', 0xc0, 'b', 0xdb}));
  CHECK(encoded == bytes({0xc0, 'a', 0xdb, 0xdc, 'b', 0xdb, 0xdd, 0xc0}));

  auto decoded = framing::slip_decode(encoded);
  REQUIRE(decoded.status == framing::decode_status::frame);
  CHECK(decoded.frame == bytes({'a', 0xc0, 'b', 0xdb}));
  CHECK(decoded.rest.empty());
}

TEST_CASE("slip round-trips any payload, including an empty one") {
  auto empty = framing::slip_decode(framing::slip_encode(""));
  REQUIRE(empty.status == framing::decode_status::frame);
  CHECK(empty.frame.empty());
  CHECK(empty.rest.empty());

  constexpr std::string_view alphabet("\xc0\xdb\xdc\xdd\x00" "a#", 7);
  for (const auto& payload : gdbhub::test::sample_payloads(alphabet, 500, 32)) {
    CAPTURE(payload);
    auto decoded = framing::slip_decode(framing::slip_encode(payload));
    REQUIRE(decoded.status == framing::decode_status::frame);
    CHECK(decoded.frame == payload);
    CHECK(decoded.rest.empty());
  }
}

TEST_CASE("length prefixed frames round-trip") {
  for (const auto& payload : gdbhub::test::sample_payloads(std::string_view("\x00\xff\xc0" "ab", 5), 200, 300)) {
    auto encoded = framing::length_encode(2, payload);
    REQUIRE(encoded.has_value());
    auto decoded = framing::length_decode(2, *encoded);
    REQUIRE(decoded.status == framing::decode_status::frame);
    CHECK(decoded.frame == payload);
    CHECK(decoded.rest.empty());
  }
}

TEST_CASE("a lone terminator closes an empty frame") {
  auto decoded = framing::slip_decode(bytes({0xc0}));
  REQUIRE(decoded.status == framing::decode_status::frame);
  CHECK(decoded.frame.empty());
  CHECK(decoded.rest.empty());
}

TEST_CASE("slip keeps the bytes after the first frame") {
  auto decoded = framing::slip_decode(bytes({0xc0, 0xc0, 'x', 0xc0, 'y'}));
  REQUIRE(decoded.status == framing::decode_status::frame);
  CHECK(decoded.frame == "x");
  CHECK(decoded.rest == "y");
}

TEST_CASE("slip waits for the terminator") {
  CHECK(framing::slip_decode(bytes({0xc0, 'a', 'b'})).status == framing::decode_status::more);
  CHECK(framing::slip_decode(bytes({'a', 0xdb})).status == framing::decode_status::more);
  CHECK(framing::slip_decode("").status == framing::decode_status::more);
}

TEST_CASE("slip rejects unknown escapes") {
  auto decoded = framing::slip_decode(bytes({0xc0, 'a', 0xdb, 0x01, 0xc0}));
  CHECK(decoded.status == framing::decode_status::error);
  CHECK_FALSE(decoded.error.empty());
}

TEST_CASE("length prefixed frames use a big-endian header") {
  auto decoded = framing::length_decode(2, bytes({0, 3, 'a', 'b', 'c', 'x'}));
  REQUIRE(decoded.status == framing::decode_status::frame);
  CHECK(decoded.frame == "abc");
  CHECK(decoded.rest == "x");

  CHECK(framing::length_decode(1, bytes({5, 'a'})).status == framing::decode_status::more);
  CHECK(framing::length_decode(4, bytes({0, 0})).status == framing::decode_status::more);

  auto encoded = framing::length_encode(4, "hi");
  REQUIRE(encoded.has_value());
  CHECK(*encoded == bytes({0, 0, 0, 2, 'h', 'i'}));
}

TEST_CASE("length prefixed encoding refuses frames too long for the header") {
  CHECK_FALSE(framing::length_encode(1, std::string(256, 'x')).has_value());
  CHECK(framing::length_encode(1, std::string(255, 'x')).has_value());
  CHECK_FALSE(framing::length_encode(3, "x").has_value());
}

TEST_CASE("raw framing passes everything through") {
  auto decoded = framing::raw_decode("abc");
  REQUIRE(decoded.status == framing::decode_status::frame);
  CHECK(decoded.frame == "abc");
  CHECK(decoded.rest.empty());
  CHECK(framing::raw_decode("").status == framing::decode_status::more);
}

TEST_CASE("parse_family accepts every spelling") {
  CHECK(std::holds_alternative<framing::raw_family>(*framing::parse_family("raw")));
  CHECK(std::holds_alternative<framing::slip_family>(*framing::parse_family(" slip ")));

  auto packet = framing::parse_family("packet4");
  REQUIRE(packet.has_value());
  CHECK(std::get<framing::length_prefixed_family>(*packet).header_size == 4);

  auto tuple = framing::parse_family("{packet,2}");
  REQUIRE(tuple.has_value());
  CHECK(std::get<framing::length_prefixed_family>(*tuple).header_size == 2);

  auto explicit_lp = framing::parse_family("length_prefixed(1)");
  REQUIRE(explicit_lp.has_value());
  CHECK(std::get<framing::length_prefixed_family>(*explicit_lp).header_size == 1);

  auto driver = framing::parse_family("driver:usb_serial:slip");
  REQUIRE(driver.has_value());
  REQUIRE(std::holds_alternative<framing::driver_family>(*driver));
  CHECK(std::get<framing::driver_family>(*driver).module == "usb_serial");
  CHECK(std::holds_alternative<framing::slip_family>(framing::resolve_base(*driver)));

  auto driver_tuple = framing::parse_family("{driver,mod,{packet,2}}");
  REQUIRE(driver_tuple.has_value());
  auto base = framing::resolve_base(*driver_tuple);
  REQUIRE(std::holds_alternative<framing::length_prefixed_family>(base));
  CHECK(std::get<framing::length_prefixed_family>(base).header_size == 2);
}

TEST_CASE("parse_family rejects unknown names") {
  CHECK_FALSE(framing::parse_family("bogus").has_value());
  CHECK_FALSE(framing::parse_family("packet3").has_value());
  CHECK_FALSE(framing::parse_family("{packet,x}").has_value());
  CHECK_FALSE(framing::parse_family("driver::slip").has_value());
  CHECK_FALSE(framing::parse_family("").has_value());
}

TEST_CASE("parse_family_or_raw falls back with a warning") {
  gdbhub::test::log_capture logs;
  auto fam = framing::parse_family_or_raw("bogus");
  CHECK(std::holds_alternative<framing::raw_family>(fam));
  CHECK(logs.contains("unknown protocol 'bogus'"));
}

TEST_CASE("describe renders families") {
  CHECK(framing::describe(framing::raw_family{}) == "raw");
  CHECK(framing::describe(framing::slip_family{}) == "slip");
  CHECK(framing::describe(framing::length_prefixed_family{2}) == "{packet,2}");
  CHECK(framing::describe(framing::make_driver("mod", framing::slip_family{})) == "{driver,mod,slip}");
}

TEST_CASE("decoder and encoder follow the resolved family") {
  framing::decoder decode(framing::make_driver("mod", framing::slip_family{}));
  auto decoded = decode(bytes({0xc0, 'o', 'k', 0xc0}));
  REQUIRE(decoded.status == framing::decode_status::frame);
  CHECK(decoded.frame == "ok");

  framing::encoder encode(framing::length_prefixed_family{1});
  auto encoded = encode("ok");
  REQUIRE(encoded.has_value());
  CHECK(*encoded == bytes({2, 'o', 'k'}));
  CHECK_FALSE(encode(std::string(300, 'x')).has_value());

  framing::decoder fallback;
  CHECK(fallback("abc").frame == "abc");
  CHECK(framing::describe(fallback.source()) == "raw");
}
