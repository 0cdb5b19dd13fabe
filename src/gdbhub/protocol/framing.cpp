#include "gdbhub/protocol/framing.hpp"

#include <cctype>
#include <charconv>
#include <vector>

#include "gdbhub/log.hpp"

namespace gdbhub::framing {

namespace {

template <typename... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string_view trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

bool valid_header_size(uint32_t size) { return size == 1 || size == 2 || size == 4; }

std::optional<uint32_t> parse_header_size(std::string_view text) {
  text = trim(text);
  uint32_t value = 0;
  auto result = std::from_chars(text.data(), text.data() + text.size(), value, 10);
  if (result.ec != std::errc{} || result.ptr != text.data() + text.size() || !valid_header_size(value)) {
    return std::nullopt;
  }
  return value;
}

// Splits "a,{b,c},d" on top level commas.
std::vector<std::string_view> split_top_level(std::string_view text) {
  std::vector<std::string_view> parts;
  int depth = 0;
  size_t start = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '{' || c == '(') {
      ++depth;
    } else if (c == '}' || c == ')') {
      --depth;
    } else if (c == ',' && depth == 0) {
      parts.push_back(trim(text.substr(start, i - start)));
      start = i + 1;
    }
  }
  parts.push_back(trim(text.substr(start)));
  return parts;
}

std::optional<family> parse_tuple(std::string_view body) {
  auto parts = split_top_level(body);
  if (parts.empty()) {
    return std::nullopt;
  }
  if (parts[0] == "packet" && parts.size() == 2) {
    if (auto size = parse_header_size(parts[1])) {
      return length_prefixed_family{*size};
    }
    return std::nullopt;
  }
  if (parts[0] == "driver" && parts.size() == 3) {
    auto inner = parse_family(parts[2]);
    if (!inner) {
      return std::nullopt;
    }
    return make_driver(std::string(parts[1]), std::move(*inner));
  }
  return std::nullopt;
}

void put_be(std::string& out, uint64_t value, uint32_t bytes) {
  for (uint32_t i = bytes; i > 0; --i) {
    out.push_back(static_cast<char>((value >> ((i - 1) * 8)) & 0xff));
  }
}

decode_result raw_decode_fn(uint32_t, std::string_view buffer) { return raw_decode(buffer); }

decode_result slip_decode_fn(uint32_t, std::string_view buffer) { return slip_decode(buffer); }

std::optional<std::string> raw_encode_fn(uint32_t, std::string_view frame) { return raw_encode(frame); }

std::optional<std::string> slip_encode_fn(uint32_t, std::string_view frame) { return slip_encode(frame); }

} // namespace

family make_driver(std::string module, family inner) {
  return driver_family{std::move(module), std::make_shared<const family>(std::move(inner))};
}

family resolve_base(const family& fam) {
  if (const auto* driver = std::get_if<driver_family>(&fam)) {
    if (!driver->inner) {
      return raw_family{};
    }
    return resolve_base(*driver->inner);
  }
  return fam;
}

std::string describe(const family& fam) {
  return std::visit(
      overloaded{
          [](const raw_family&) -> std::string { return "raw"; },
          [](const length_prefixed_family& lp) -> std::string {
            return fmt::format("{{packet,{}}}", lp.header_size);
          },
          [](const slip_family&) -> std::string { return "slip"; },
          [](const driver_family& driver) -> std::string {
            return fmt::format("{{driver,{},{}}}", driver.module, driver.inner ? describe(*driver.inner) : "raw");
          },
      },
      fam);
}

std::optional<family> parse_family(std::string_view text) {
  text = trim(text);
  if (text == "raw") {
    return raw_family{};
  }
  if (text == "slip") {
    return slip_family{};
  }
  if (text.size() > 6 && text.substr(0, 6) == "packet") {
    if (auto size = parse_header_size(text.substr(6))) {
      return length_prefixed_family{*size};
    }
    return std::nullopt;
  }
  constexpr std::string_view lp_prefix = "length_prefixed(";
  if (text.size() > lp_prefix.size() && text.substr(0, lp_prefix.size()) == lp_prefix && text.back() == ')') {
    auto inner = text.substr(lp_prefix.size(), text.size() - lp_prefix.size() - 1);
    if (auto size = parse_header_size(inner)) {
      return length_prefixed_family{*size};
    }
    return std::nullopt;
  }
  constexpr std::string_view driver_prefix = "driver:";
  if (text.substr(0, driver_prefix.size()) == driver_prefix) {
    auto rest = text.substr(driver_prefix.size());
    auto colon = rest.find(':');
    if (colon == std::string_view::npos || colon == 0) {
      return std::nullopt;
    }
    auto inner = parse_family(rest.substr(colon + 1));
    if (!inner) {
      return std::nullopt;
    }
    return make_driver(std::string(rest.substr(0, colon)), std::move(*inner));
  }
  if (text.size() >= 2 && text.front() == '{' && text.back() == '}') {
    return parse_tuple(text.substr(1, text.size() - 2));
  }
  return std::nullopt;
}

family parse_family_or_raw(std::string_view text) {
  if (auto fam = parse_family(text)) {
    return *fam;
  }
  log::warn("unknown protocol '{}', using raw", log::printable(text));
  return raw_family{};
}

decode_result raw_decode(std::string_view buffer) {
  if (buffer.empty()) {
    return decode_result::more();
  }
  return decode_result::complete(std::string(buffer), {});
}

std::string raw_encode(std::string_view frame) { return std::string(frame); }

decode_result length_decode(uint32_t header_size, std::string_view buffer) {
  if (!valid_header_size(header_size)) {
    return decode_result::failure(fmt::format("invalid length header size {}", header_size));
  }
  if (buffer.size() < header_size) {
    return decode_result::more();
  }
  uint64_t length = 0;
  for (uint32_t i = 0; i < header_size; ++i) {
    length = (length << 8) | static_cast<unsigned char>(buffer[i]);
  }
  if (buffer.size() - header_size < length) {
    return decode_result::more();
  }
  auto frame = buffer.substr(header_size, static_cast<size_t>(length));
  auto rest = buffer.substr(header_size + static_cast<size_t>(length));
  return decode_result::complete(std::string(frame), std::string(rest));
}

std::optional<std::string> length_encode(uint32_t header_size, std::string_view frame) {
  if (!valid_header_size(header_size)) {
    return std::nullopt;
  }
  uint64_t max_length = header_size == 4 ? 0xffffffffULL : ((1ULL << (header_size * 8)) - 1);
  if (frame.size() > max_length) {
    return std::nullopt;
  }
  std::string out;
  out.reserve(frame.size() + header_size);
  put_be(out, frame.size(), header_size);
  out.append(frame.data(), frame.size());
  return out;
}

decode_result slip_decode(std::string_view buffer) {
  std::string frame;
  frame.reserve(buffer.size());
  for (size_t i = 0; i < buffer.size(); ++i) {
    auto b = static_cast<uint8_t>(buffer[i]);
    if (b == slip_end && frame.empty() && i + 1 < buffer.size()) {
      // Leading terminators are skipped while data follows; a final one
      // closes an empty frame.
      continue;
    }
    if (b == slip_end) {
      return decode_result::complete(std::move(frame), std::string(buffer.substr(i + 1)));
    }
    if (b != slip_esc) {
      frame.push_back(static_cast<char>(b));
      continue;
    }
    if (i + 1 == buffer.size()) {
      return decode_result::more();
    }
    auto next = static_cast<uint8_t>(buffer[++i]);
    if (next == slip_esc_end) {
      frame.push_back(static_cast<char>(slip_end));
    } else if (next == slip_esc_esc) {
      frame.push_back(static_cast<char>(slip_esc));
    } else {
      return decode_result::failure(fmt::format("invalid slip escape 0x{:02x}", next));
    }
  }
  return decode_result::more();
}

std::string slip_encode(std::string_view frame) {
  std::string out;
  out.reserve(frame.size() * 2 + 2);
  out.push_back(static_cast<char>(slip_end));
  for (unsigned char b : frame) {
    if (b == slip_end) {
      out.push_back(static_cast<char>(slip_esc));
      out.push_back(static_cast<char>(slip_esc_end));
    } else if (b == slip_esc) {
      out.push_back(static_cast<char>(slip_esc));
      out.push_back(static_cast<char>(slip_esc_esc));
    } else {
      out.push_back(static_cast<char>(b));
    }
  }
  out.push_back(static_cast<char>(slip_end));
  return out;
}

decoder::decoder(const family& fam) : source_(fam) {
  std::visit(overloaded{
                 [this](const length_prefixed_family& lp) {
                   fn_ = &length_decode;
                   param_ = lp.header_size;
                 },
                 [this](const slip_family&) { fn_ = &slip_decode_fn; },
                 [this](const auto&) { fn_ = &raw_decode_fn; },
             },
             resolve_base(fam));
}

decode_result decoder::operator()(std::string_view buffer) const {
  if (!fn_) {
    return raw_decode(buffer);
  }
  return fn_(param_, buffer);
}

encoder::encoder(const family& fam) : source_(fam) {
  std::visit(overloaded{
                 [this](const length_prefixed_family& lp) {
                   fn_ = &length_encode;
                   param_ = lp.header_size;
                 },
                 [this](const slip_family&) { fn_ = &slip_encode_fn; },
                 [this](const auto&) { fn_ = &raw_encode_fn; },
             },
             resolve_base(fam));
}

std::optional<std::string> encoder::operator()(std::string_view frame) const {
  if (!fn_) {
    return raw_encode(frame);
  }
  return fn_(param_, frame);
}

} // namespace gdbhub::framing
