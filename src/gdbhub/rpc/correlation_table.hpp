#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>

namespace gdbhub::rpc {

using token = uint32_t;

// Pairs outgoing calls with their replies. Tokens are the smallest unused
// non-negative integers, so they stay small enough for a one-byte ack.
template <typename Caller>
class correlation_table {
public:
  token allocate(Caller caller) {
    token next = 0;
    for (const auto& entry : entries_) {
      if (entry.first != next) {
        break;
      }
      ++next;
    }
    entries_.emplace(next, std::move(caller));
    return next;
  }

  // Empty for a token that was never allocated or is already resolved.
  std::optional<Caller> resolve(token id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    Caller caller = std::move(it->second);
    entries_.erase(it);
    return caller;
  }

  bool contains(token id) const { return entries_.find(id) != entries_.end(); }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  // Removes every entry the predicate accepts; the predicate may consume it.
  template <typename Pred>
  size_t erase_if(Pred pred) {
    size_t erased = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (pred(it->first, it->second)) {
        it = entries_.erase(it);
        ++erased;
      } else {
        ++it;
      }
    }
    return erased;
  }

  void clear() { entries_.clear(); }

private:
  std::map<token, Caller> entries_;
};

} // namespace gdbhub::rpc
