#include <csignal>
#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <pthread.h>
#include <signal.h>

#include <args.hxx>
#include <fmt/core.h>

#include "gdbhub/gdbhub.hpp"

namespace {

bool skip_line(std::string_view line) {
  auto start = line.find_first_not_of(" \t\r");
  return start == std::string_view::npos || line[start] == '#';
}

// Kernel log lines carry no devpath; the USB address stands in for it.
bool attach_from_syslog(gdbhub::hub& hub, const std::string& host, std::string_view line) {
  auto tty = gdbhub::parse_syslog_tty_acm(line);
  if (!tty) {
    return false;
  }
  hub.attach(gdbhub::attach_notification{
      .board = "",
      .host = host,
      .tty = "/dev/" + tty->tty,
      .devpath = tty->usb_address,
      .app_running = false,
  });
  return true;
}

void print_devices(gdbhub::hub& hub) {
  for (const auto& id : hub.devices()) {
    auto record = hub.info(id);
    if (!record) {
      fmt::print("{} (no reply)\n", id.str());
      continue;
    }
    fmt::print("{} tty={} port={} state={} mode={} uid={} decode={} encode={}\n", id.str(), record->tty,
               record->tcp_port, gdbhub::to_string(record->state), gdbhub::to_string(record->mode),
               record->uid.value_or("-"), record->decode_protocol, record->encode_protocol);
  }
  std::fflush(stdout);
}

} // namespace

int main(int argc, char** argv) {
  args::ArgumentParser parser("gdbhub device hub",
                              "Reads \"<board> add|remove <host> <tty> [devpath] [app]\" lines from stdin.");
  args::HelpFlag help(parser, "help", "display this help menu", {'h', "help"});
  args::ValueFlag<std::string> spawn_command(parser, "cmd", "bridge command run per device", {"spawn-command"});
  args::ValueFlag<std::string> remote_shell(parser, "cmd", "shell used to reach other hosts", {"remote-shell"});
  args::ValueFlag<std::string> local_host(parser, "host", "name of this host", {"local-host"});
  args::ValueFlag<std::string> bind_host(parser, "host", "address debug servers bind to", {'b', "bind"});
  args::ValueFlag<int> port_base(parser, "port", "first debug server port", {"port-base"});
  args::ValueFlag<int> port_span(parser, "count", "number of debug server ports", {"port-span"});
  args::ValueFlag<int> dispatch_timeout(parser, "ms", "debug request timeout", {"dispatch-timeout"});
  args::Flag no_servers(parser, "no-servers", "do not start debug servers", {"no-servers"});
  args::ValueFlag<std::string> syslog_host(parser, "host", "also accept cdc_acm kernel log lines from host",
                                           {"syslog-host"});
  args::ValueFlag<std::string> log_level(parser, "level", "debug|info|warn|error", {'v', "log-level"});
  args::Flag list(parser, "list", "print the registry once stdin is closed", {"list"});
  args::Flag once(parser, "once", "exit once stdin is closed", {"once"});

  try {
    parser.ParseCLI(argc, argv);
  } catch (const args::Help&) {
    std::cout << parser;
    return 0;
  } catch (const args::ParseError& err) {
    std::cerr << err.what() << "\n";
    std::cerr << parser;
    return 1;
  }

  if (log_level) {
    auto parsed = gdbhub::log::parse_level(args::get(log_level));
    if (!parsed) {
      std::cerr << "unknown log level: " << args::get(log_level) << "\n";
      return 1;
    }
    gdbhub::log::set_level(*parsed);
  }

  gdbhub::hub_config config;
  if (spawn_command) {
    config.spawn_command = args::get(spawn_command);
  }
  if (remote_shell) {
    config.remote_shell = args::get(remote_shell);
  }
  if (local_host) {
    config.local_host = args::get(local_host);
  }
  if (bind_host) {
    config.bind_host = args::get(bind_host);
  }
  if (port_base) {
    int base = args::get(port_base);
    if (base <= 0 || base > 65535) {
      std::cerr << "invalid port-base: " << base << "\n";
      return 1;
    }
    config.port_base = static_cast<uint16_t>(base);
  }
  if (port_span) {
    int span = args::get(port_span);
    if (span <= 0 || config.port_base + span - 1 > 65535) {
      std::cerr << "invalid port-span: " << span << "\n";
      return 1;
    }
    config.port_span = static_cast<uint16_t>(span);
  }
  if (dispatch_timeout) {
    int ms = args::get(dispatch_timeout);
    if (ms <= 0) {
      std::cerr << "dispatch-timeout must be positive\n";
      return 1;
    }
    config.dispatch_timeout = std::chrono::milliseconds(ms);
  }
  config.start_servers = !no_servers;

  // Writes to exited bridges and dropped clients are reported as errors.
  std::signal(SIGPIPE, SIG_IGN);

  // Block the shutdown signals before any thread exists so they are only
  // picked up by sigwait below.
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

  gdbhub::process_spawner spawner(config.local_host, config.remote_shell);
  gdbhub::hub hub(config, spawner);
  hub.start();
  gdbhub::log::info("gdbhub {} on {}", gdbhub::version(), spawner.local_host());

  std::string line;
  while (std::getline(std::cin, line)) {
    if (skip_line(line)) {
      continue;
    }
    if (syslog_host && attach_from_syslog(hub, args::get(syslog_host), line)) {
      continue;
    }
    hub.notify_line(line);
  }

  if (list) {
    print_devices(hub);
  }

  if (!once) {
    int signal = 0;
    sigwait(&stop_signals, &signal);
    gdbhub::log::info("signal {}, stopping", signal);
  }

  hub.stop();
  return 0;
}
