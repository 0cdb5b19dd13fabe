#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace gdbhub::framing {

constexpr uint8_t slip_end = 192;
constexpr uint8_t slip_esc = 219;
constexpr uint8_t slip_esc_end = 220;
constexpr uint8_t slip_esc_esc = 221;

struct raw_family {};

struct length_prefixed_family {
  // Size in bytes of the big-endian length header: 1, 2 or 4.
  uint32_t header_size = 4;
};

struct slip_family {};

struct driver_family;

using family = std::variant<raw_family, length_prefixed_family, slip_family, driver_family>;

// Framing implemented by an external driver module M on top of an inner
// family. Only the inner family matters here.
struct driver_family {
  std::string module;
  std::shared_ptr<const family> inner;
};

family make_driver(std::string module, family inner);

// Follows driver wrappers down to the family that does the framing.
family resolve_base(const family& fam);

std::string describe(const family& fam);

// Accepts "raw", "slip", "packetN", "{packet,N}", "length_prefixed(N)",
// "driver:M:P" and "{driver,M,P}".
std::optional<family> parse_family(std::string_view text);

// Same as parse_family, falling back to raw with a warning.
family parse_family_or_raw(std::string_view text);

enum class decode_status { frame, more, error };

struct decode_result {
  decode_status status = decode_status::more;
  std::string frame;
  std::string rest;
  std::string error;

  static decode_result more() { return {}; }

  static decode_result complete(std::string frame_value, std::string rest_value) {
    decode_result result;
    result.status = decode_status::frame;
    result.frame = std::move(frame_value);
    result.rest = std::move(rest_value);
    return result;
  }

  static decode_result failure(std::string reason) {
    decode_result result;
    result.status = decode_status::error;
    result.error = std::move(reason);
    return result;
  }
};

decode_result raw_decode(std::string_view buffer);
std::string raw_encode(std::string_view frame);

decode_result length_decode(uint32_t header_size, std::string_view buffer);
std::optional<std::string> length_encode(uint32_t header_size, std::string_view frame);

decode_result slip_decode(std::string_view buffer);
std::string slip_encode(std::string_view frame);

class decoder {
public:
  decoder() = default;
  explicit decoder(const family& fam);

  decode_result operator()(std::string_view buffer) const;
  const family& source() const { return source_; }

private:
  using decode_fn = decode_result (*)(uint32_t, std::string_view);

  family source_ = raw_family{};
  decode_fn fn_ = nullptr;
  uint32_t param_ = 0;
};

class encoder {
public:
  encoder() = default;
  explicit encoder(const family& fam);

  // Empty when the frame cannot be represented, e.g. too long for its header.
  std::optional<std::string> operator()(std::string_view frame) const;
  const family& source() const { return source_; }

private:
  using encode_fn = std::optional<std::string> (*)(uint32_t, std::string_view);

  family source_ = raw_family{};
  encode_fn fn_ = nullptr;
  uint32_t param_ = 0;
};

} // namespace gdbhub::framing
