#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gdbhub::term {

// Subset of the Erlang external term format spoken by the device firmware.
constexpr uint8_t version_magic = 131;

enum class kind { integer, floating, atom, binary, string, list, tuple, nil };

struct value {
  kind type = kind::nil;
  int64_t integer = 0;
  double floating = 0.0;
  std::string text;
  std::vector<value> items;
};

std::string encode_integer(int64_t number);
// Full encoding with the version byte. Lists are always proper.
std::string encode(const value& term);

value make_integer(int64_t number);
value make_atom(std::string name);
value make_binary(std::string data);
value make_tuple(std::vector<value> items);
value make_list(std::vector<value> items);

// Decodes one term. Bytes after the term are ignored; `used` receives the
// number of bytes consumed.
std::optional<value> decode(std::string_view data, size_t* used = nullptr);
std::optional<int64_t> decode_integer(std::string_view data);

std::string to_string(const value& term);

// Log text carried by a firmware log term: [{123, Text}].
std::optional<std::string> log_text(const value& term);

} // namespace gdbhub::term
