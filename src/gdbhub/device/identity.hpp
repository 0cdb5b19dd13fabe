#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gdbhub {

// Where a device is plugged in. The USB port survives re-enumeration under a
// different tty name, the tty path is the fallback.
struct device_id {
  std::string host;
  std::string location;
  bool usb_port = false;

  std::string str() const;

  auto operator<=>(const device_id&) const = default;
};

struct attach_notification {
  std::string board;
  std::string host;
  std::string tty;
  // sysfs device path, e.g. /devices/pci0000:00/.../9-2.4:1.0/tty/ttyACM1
  std::string devpath;
  bool app_running = false;
};

enum class notify_action { add, remove };

struct notify_event {
  notify_action action = notify_action::add;
  attach_notification device;
};

// USB port ("9-2.4") of the interface the tty hangs off.
std::optional<std::string> devpath_usb_port(std::string_view devpath);

device_id resolve_identity(const attach_notification& device);

// 64-bit FNV-1a over host and devpath, separated by a NUL.
uint64_t location_hash(std::string_view host, std::string_view devpath);

// base + hash mod span. Collisions between devices are not detected.
uint16_t tcp_port_for(std::string_view host, std::string_view devpath, uint16_t base, uint16_t span);

// "<board> add|remove <host> <tty> [devpath] [app]"
std::optional<notify_event> parse_notify_line(std::string_view line);

struct syslog_tty {
  std::string usb_address;
  std::string tty;
};

// Kernel log line announcing a cdc_acm tty, for hosts without udev.
std::optional<syslog_tty> parse_syslog_tty_acm(std::string_view line);

} // namespace gdbhub
