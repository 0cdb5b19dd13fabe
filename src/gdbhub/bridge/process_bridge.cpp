#include "gdbhub/bridge/process_bridge.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "gdbhub/log.hpp"
#include "gdbhub/posix/fd_handle.hpp"

namespace gdbhub {

namespace {

constexpr auto k_poll_interval = std::chrono::milliseconds(100);
constexpr auto k_reap_interval = std::chrono::milliseconds(10);
constexpr auto k_exit_grace = std::chrono::milliseconds(2000);

using posix::fd_handle;

bool make_pipe(fd_handle& read_end, fd_handle& write_end) {
  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    return false;
  }
  read_end = fd_handle(fds[0]);
  write_end = fd_handle(fds[1]);
  return true;
}

class process_channel final : public bridge_channel {
public:
  process_channel(pid_t pid, fd_handle to_child, fd_handle from_child)
      : pid_(pid), to_child_(std::move(to_child)), from_child_(std::move(from_child)) {}

  ~process_channel() override { close(); }

  void start(bridge_events events) override {
    events_ = std::move(events);
    reader_ = std::thread([this] { read_loop(); });
  }

  bool write(std::string_view data) override {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!to_child_.valid()) {
      return false;
    }
    size_t offset = 0;
    while (offset < data.size()) {
      auto written = ::write(to_child_.get(), data.data() + offset, data.size() - offset);
      if (written < 0 && errno == EINTR) {
        continue;
      }
      if (written <= 0) {
        return false;
      }
      offset += static_cast<size_t>(written);
    }
    return true;
  }

  void close() override {
    stopping_.store(true);
    {
      std::lock_guard<std::mutex> lock(write_mutex_);
      to_child_.close();
    }
    if (!exited_.load() && pid_ > 0) {
      ::kill(pid_, SIGTERM);
    }
    if (reader_.joinable()) {
      reader_.join();
    }
    reap(k_exit_grace);
  }

private:
  void read_loop() {
    std::array<char, 4096> buffer{};
    while (!stopping_.load()) {
      auto waited = posix::wait_readable(from_child_.get(), k_poll_interval);
      if (waited == posix::wait_result::failed) {
        break;
      }
      if (waited != posix::wait_result::ready) {
        continue;
      }
      auto count = ::read(from_child_.get(), buffer.data(), buffer.size());
      if (count < 0 && errno == EINTR) {
        continue;
      }
      if (count <= 0) {
        break;
      }
      if (events_.on_data) {
        events_.on_data(std::string(buffer.data(), static_cast<size_t>(count)));
      }
    }
    if (stopping_.load()) {
      return;
    }
    int status = reap(k_exit_grace);
    if (events_.on_exit) {
      events_.on_exit(status);
    }
  }

  // Waits up to `grace` for the child, then kills it.
  int reap(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (exited_.load() || pid_ <= 0) {
      return status_;
    }
    int raw = 0;
    pid_t result = 0;
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (true) {
      result = ::waitpid(pid_, &raw, WNOHANG);
      if (result < 0 && errno == EINTR) {
        continue;
      }
      if (result != 0 || std::chrono::steady_clock::now() >= deadline) {
        break;
      }
      std::this_thread::sleep_for(k_reap_interval);
    }
    if (result == 0) {
      log::warn("bridge pid {} still running, killing it", pid_);
      ::kill(pid_, SIGKILL);
      do {
        result = ::waitpid(pid_, &raw, 0);
      } while (result < 0 && errno == EINTR);
    }
    exited_.store(true);
    if (result < 0) {
      status_ = -1;
    } else if (WIFEXITED(raw)) {
      status_ = WEXITSTATUS(raw);
    } else if (WIFSIGNALED(raw)) {
      status_ = 128 + WTERMSIG(raw);
    } else {
      status_ = -1;
    }
    return status_;
  }

  pid_t pid_ = -1;
  fd_handle to_child_;
  fd_handle from_child_;
  bridge_events events_;
  std::thread reader_;
  std::mutex write_mutex_;
  std::mutex reap_mutex_;
  std::atomic<bool> stopping_{false};
  std::atomic<bool> exited_{false};
  int status_ = -1;
};

} // namespace

process_spawner::process_spawner(std::string local_host, std::string remote_shell)
    : local_host_(local_host.empty() ? local_host_name() : std::move(local_host)),
      remote_shell_(std::move(remote_shell)) {}

bool process_spawner::is_local(const std::string& host) const {
  return host.empty() || host == local_host_ || host == "localhost";
}

std::unique_ptr<bridge_channel> process_spawner::spawn(const spawn_request& request) {
  std::vector<std::string> argv_text;
  if (!is_local(request.host)) {
    argv_text.push_back(remote_shell_);
    argv_text.push_back(request.host);
  }
  argv_text.push_back(request.command);
  argv_text.insert(argv_text.end(), request.args.begin(), request.args.end());

  std::vector<char*> argv;
  argv.reserve(argv_text.size() + 1);
  for (auto& arg : argv_text) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  fd_handle stdin_read;
  fd_handle stdin_write;
  fd_handle stdout_read;
  fd_handle stdout_write;
  if (!make_pipe(stdin_read, stdin_write) || !make_pipe(stdout_read, stdout_write)) {
    log::error("pipe failed: {}", std::strerror(errno));
    return nullptr;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    log::error("fork failed: {}", std::strerror(errno));
    return nullptr;
  }

  if (pid == 0) {
    // The hub blocks its shutdown signals and ignores SIGPIPE; the bridge
    // starts with the defaults.
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    ::signal(SIGPIPE, SIG_DFL);
    ::dup2(stdin_read.get(), STDIN_FILENO);
    ::dup2(stdout_write.get(), STDOUT_FILENO);
    ::execvp(argv[0], argv.data());
    ::_exit(127);
  }

  log::debug("spawned {} as pid {}", argv_text.front(), pid);
  return std::make_unique<process_channel>(pid, std::move(stdin_write), std::move(stdout_read));
}

std::string local_host_name() {
  std::array<char, 256> name{};
  if (::gethostname(name.data(), name.size() - 1) != 0) {
    return "localhost";
  }
  return std::string(name.data());
}

} // namespace gdbhub
