#include "gdbhub/protocol/term.hpp"

#include <bit>
#include <limits>

#include <fmt/core.h>

namespace gdbhub::term {

namespace {

constexpr uint8_t k_new_float = 70;
constexpr uint8_t k_small_integer = 97;
constexpr uint8_t k_integer = 98;
constexpr uint8_t k_atom = 100;
constexpr uint8_t k_small_tuple = 104;
constexpr uint8_t k_large_tuple = 105;
constexpr uint8_t k_nil = 106;
constexpr uint8_t k_string = 107;
constexpr uint8_t k_list = 108;
constexpr uint8_t k_binary = 109;
constexpr uint8_t k_small_big = 110;
constexpr uint8_t k_small_atom = 115;
constexpr uint8_t k_atom_utf8 = 118;
constexpr uint8_t k_small_atom_utf8 = 119;

constexpr int k_max_depth = 64;

class reader {
public:
  explicit reader(std::string_view data) : data_(data) {}

  size_t offset() const { return offset_; }

  bool read_u8(uint8_t& out) {
    if (offset_ + 1 > data_.size()) {
      return false;
    }
    out = static_cast<uint8_t>(data_[offset_++]);
    return true;
  }

  bool read_be(uint32_t bytes, uint64_t& out) {
    if (offset_ + bytes > data_.size()) {
      return false;
    }
    out = 0;
    for (uint32_t i = 0; i < bytes; ++i) {
      out = (out << 8) | static_cast<unsigned char>(data_[offset_++]);
    }
    return true;
  }

  bool read_bytes(uint64_t count, std::string& out) {
    if (count > data_.size() - offset_) {
      return false;
    }
    out.assign(data_.substr(offset_, static_cast<size_t>(count)));
    offset_ += static_cast<size_t>(count);
    return true;
  }

private:
  std::string_view data_;
  size_t offset_ = 0;
};

bool decode_sized(reader& in, uint32_t size_bytes, kind type, value& out) {
  uint64_t length = 0;
  if (!in.read_be(size_bytes, length)) {
    return false;
  }
  out.type = type;
  return in.read_bytes(length, out.text);
}

bool decode_value(reader& in, value& out, int depth);

bool decode_items(reader& in, uint64_t count, value& out, int depth) {
  for (uint64_t i = 0; i < count; ++i) {
    value item;
    if (!decode_value(in, item, depth + 1)) {
      return false;
    }
    out.items.push_back(std::move(item));
  }
  return true;
}

bool decode_value(reader& in, value& out, int depth) {
  if (depth > k_max_depth) {
    return false;
  }
  uint8_t tag = 0;
  if (!in.read_u8(tag)) {
    return false;
  }

  uint64_t raw = 0;
  switch (tag) {
  case k_small_integer:
    if (!in.read_be(1, raw)) {
      return false;
    }
    out.type = kind::integer;
    out.integer = static_cast<int64_t>(raw);
    return true;
  case k_integer:
    if (!in.read_be(4, raw)) {
      return false;
    }
    out.type = kind::integer;
    out.integer = static_cast<int32_t>(static_cast<uint32_t>(raw));
    return true;
  case k_small_big: {
    uint64_t digits = 0;
    uint64_t sign = 0;
    if (!in.read_be(1, digits) || !in.read_be(1, sign) || digits > 8) {
      return false;
    }
    uint64_t magnitude = 0;
    for (uint64_t i = 0; i < digits; ++i) {
      uint64_t digit = 0;
      if (!in.read_be(1, digit)) {
        return false;
      }
      magnitude |= digit << (8 * i);
    }
    if (magnitude > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return false;
    }
    out.type = kind::integer;
    out.integer = sign ? -static_cast<int64_t>(magnitude) : static_cast<int64_t>(magnitude);
    return true;
  }
  case k_new_float:
    if (!in.read_be(8, raw)) {
      return false;
    }
    out.type = kind::floating;
    out.floating = std::bit_cast<double>(raw);
    return true;
  case k_atom:
  case k_atom_utf8:
    return decode_sized(in, 2, kind::atom, out);
  case k_small_atom:
  case k_small_atom_utf8:
    return decode_sized(in, 1, kind::atom, out);
  case k_string:
    return decode_sized(in, 2, kind::string, out);
  case k_binary:
    return decode_sized(in, 4, kind::binary, out);
  case k_nil:
    out.type = kind::nil;
    return true;
  case k_small_tuple:
    if (!in.read_be(1, raw)) {
      return false;
    }
    out.type = kind::tuple;
    return decode_items(in, raw, out, depth);
  case k_large_tuple:
    if (!in.read_be(4, raw)) {
      return false;
    }
    out.type = kind::tuple;
    return decode_items(in, raw, out, depth);
  case k_list: {
    if (!in.read_be(4, raw)) {
      return false;
    }
    out.type = kind::list;
    if (!decode_items(in, raw, out, depth)) {
      return false;
    }
    value tail;
    if (!decode_value(in, tail, depth + 1)) {
      return false;
    }
    if (tail.type != kind::nil) {
      out.items.push_back(std::move(tail));
    }
    return true;
  }
  default:
    return false;
  }
}

void append_quoted(std::string& out, std::string_view text) {
  out.push_back('"');
  for (unsigned char c : text) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
      out.push_back(static_cast<char>(c));
    } else if (c >= 0x20 && c < 0x7f) {
      out.push_back(static_cast<char>(c));
    } else {
      out += fmt::format("\\x{:02x}", c);
    }
  }
  out.push_back('"');
}

void append_items(std::string& out, const std::vector<value>& items) {
  for (size_t i = 0; i < items.size(); ++i) {
    if (i != 0) {
      out.push_back(',');
    }
    out += to_string(items[i]);
  }
}

void put_be(std::string& out, uint64_t number, int size) {
  for (int shift = (size - 1) * 8; shift >= 0; shift -= 8) {
    out.push_back(static_cast<char>((number >> shift) & 0xff));
  }
}

void append_integer(std::string& out, int64_t number) {
  if (number >= 0 && number <= 255) {
    out.push_back(static_cast<char>(k_small_integer));
    out.push_back(static_cast<char>(number));
    return;
  }
  if (number >= std::numeric_limits<int32_t>::min() && number <= std::numeric_limits<int32_t>::max()) {
    out.push_back(static_cast<char>(k_integer));
    put_be(out, static_cast<uint32_t>(static_cast<int32_t>(number)), 4);
    return;
  }
  uint64_t magnitude = number < 0 ? 0 - static_cast<uint64_t>(number) : static_cast<uint64_t>(number);
  std::string digits;
  while (magnitude != 0) {
    digits.push_back(static_cast<char>(magnitude & 0xff));
    magnitude >>= 8;
  }
  out.push_back(static_cast<char>(k_small_big));
  out.push_back(static_cast<char>(digits.size()));
  out.push_back(static_cast<char>(number < 0 ? 1 : 0));
  out += digits;
}

void append_value(std::string& out, const value& term) {
  switch (term.type) {
  case kind::integer:
    append_integer(out, term.integer);
    return;
  case kind::floating:
    out.push_back(static_cast<char>(k_new_float));
    put_be(out, std::bit_cast<uint64_t>(term.floating), 8);
    return;
  case kind::atom:
    if (term.text.size() <= 255) {
      out.push_back(static_cast<char>(k_small_atom_utf8));
      put_be(out, term.text.size(), 1);
    } else {
      out.push_back(static_cast<char>(k_atom_utf8));
      put_be(out, term.text.size(), 2);
    }
    out += term.text;
    return;
  case kind::binary:
    out.push_back(static_cast<char>(k_binary));
    put_be(out, term.text.size(), 4);
    out += term.text;
    return;
  case kind::string:
    if (term.text.empty()) {
      out.push_back(static_cast<char>(k_nil));
      return;
    }
    if (term.text.size() <= 0xffff) {
      out.push_back(static_cast<char>(k_string));
      put_be(out, term.text.size(), 2);
      out += term.text;
      return;
    }
    // Too long for STRING_EXT: a list of byte values.
    out.push_back(static_cast<char>(k_list));
    put_be(out, term.text.size(), 4);
    for (unsigned char c : term.text) {
      append_integer(out, c);
    }
    out.push_back(static_cast<char>(k_nil));
    return;
  case kind::tuple:
    if (term.items.size() <= 255) {
      out.push_back(static_cast<char>(k_small_tuple));
      put_be(out, term.items.size(), 1);
    } else {
      out.push_back(static_cast<char>(k_large_tuple));
      put_be(out, term.items.size(), 4);
    }
    for (const auto& item : term.items) {
      append_value(out, item);
    }
    return;
  case kind::list:
    if (!term.items.empty()) {
      out.push_back(static_cast<char>(k_list));
      put_be(out, term.items.size(), 4);
      for (const auto& item : term.items) {
        append_value(out, item);
      }
    }
    out.push_back(static_cast<char>(k_nil));
    return;
  case kind::nil:
    out.push_back(static_cast<char>(k_nil));
    return;
  }
}

} // namespace

std::string encode_integer(int64_t number) {
  std::string out(1, static_cast<char>(version_magic));
  append_integer(out, number);
  return out;
}

std::string encode(const value& term) {
  std::string out(1, static_cast<char>(version_magic));
  append_value(out, term);
  return out;
}

value make_integer(int64_t number) { return value{.type = kind::integer, .integer = number}; }
value make_atom(std::string name) { return value{.type = kind::atom, .text = std::move(name)}; }
value make_binary(std::string data) { return value{.type = kind::binary, .text = std::move(data)}; }
value make_tuple(std::vector<value> items) { return value{.type = kind::tuple, .items = std::move(items)}; }
value make_list(std::vector<value> items) { return value{.type = kind::list, .items = std::move(items)}; }

std::optional<value> decode(std::string_view data, size_t* used) {
  reader in(data);
  uint8_t magic = 0;
  if (!in.read_u8(magic) || magic != version_magic) {
    return std::nullopt;
  }
  value out;
  if (!decode_value(in, out, 0)) {
    return std::nullopt;
  }
  if (used) {
    *used = in.offset();
  }
  return out;
}

std::optional<int64_t> decode_integer(std::string_view data) {
  auto term = decode(data);
  if (!term || term->type != kind::integer) {
    return std::nullopt;
  }
  return term->integer;
}

std::string to_string(const value& term) {
  std::string out;
  switch (term.type) {
  case kind::integer:
    return std::to_string(term.integer);
  case kind::floating:
    return fmt::format("{}", term.floating);
  case kind::atom:
    return term.text;
  case kind::binary:
    out = "<<";
    append_quoted(out, term.text);
    out += ">>";
    return out;
  case kind::string:
    append_quoted(out, term.text);
    return out;
  case kind::list:
    out.push_back('[');
    append_items(out, term.items);
    out.push_back(']');
    return out;
  case kind::tuple:
    out.push_back('{');
    append_items(out, term.items);
    out.push_back('}');
    return out;
  case kind::nil:
    return "[]";
  }
  return out;
}

std::optional<std::string> log_text(const value& term) {
  if (term.type != kind::list || term.items.size() != 1) {
    return std::nullopt;
  }
  const auto& entry = term.items.front();
  if (entry.type != kind::tuple || entry.items.size() != 2) {
    return std::nullopt;
  }
  const auto& key = entry.items[0];
  const auto& text = entry.items[1];
  if (key.type != kind::integer || key.integer != 123) {
    return std::nullopt;
  }
  if (text.type != kind::binary && text.type != kind::string) {
    return std::nullopt;
  }
  return text.text;
}

} // namespace gdbhub::term
