#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "gdbhub/actor/mailbox.hpp"
#include "gdbhub/bridge/bridge.hpp"
#include "gdbhub/config.hpp"
#include "gdbhub/device/device.hpp"
#include "gdbhub/device/identity.hpp"

namespace gdbhub {

// Directory of device actors keyed by where the device is plugged in. The
// map is owned by the hub thread; everything else talks to it by message.
class hub {
public:
  using up_hook = std::function<void(const std::shared_ptr<device_actor>&)>;

  hub(hub_config config, bridge_spawner& spawner);
  ~hub();

  hub(const hub&) = delete;
  hub& operator=(const hub&) = delete;

  void start();
  // Stops every registered actor and waits for them to terminate.
  void stop();

  // The hook runs on the hub thread once a device finished negotiation.
  // Queries it makes on the hub are answered in place.
  void set_up_hook(up_hook hook);
  // Used by actors started afterwards; set it before start().
  void set_default_handler(packet_handler handler);

  void attach(attach_notification device);
  void remove(attach_notification device);
  void notify(notify_event event);
  // Notifier line; false when it cannot be parsed.
  bool notify_line(std::string_view line);

  std::shared_ptr<device_actor> resolve(const device_id& id);
  std::vector<device_id> devices();
  std::vector<std::shared_ptr<device_actor>> actors();
  // uid -> actor, for devices that finished metadata negotiation.
  std::map<std::string, std::shared_ptr<device_actor>> uids();
  std::shared_ptr<device_actor> find_uid(const std::string& uid);
  std::optional<device_record> info(const device_id& id);

  const hub_config& config() const { return config_; }

private:
  using entry_list = std::vector<std::pair<device_id, std::shared_ptr<device_actor>>>;

  struct attach_request {
    attach_notification device;
  };
  struct remove_request {
    attach_notification device;
  };
  struct actor_down {
    device_id id;
    const device_actor* actor = nullptr;
    std::string reason;
  };
  struct actor_up {
    std::shared_ptr<device_actor> actor;
  };
  struct resolve_request {
    device_id id;
    std::shared_ptr<std::promise<std::shared_ptr<device_actor>>> reply;
  };
  struct list_request {
    std::shared_ptr<std::promise<entry_list>> reply;
  };
  struct set_up_hook_request {
    up_hook hook;
  };
  struct stop_request {};

  using message = std::variant<attach_request,
                               remove_request,
                               actor_down,
                               actor_up,
                               resolve_request,
                               list_request,
                               set_up_hook_request,
                               stop_request>;

  void run();
  entry_list entries();

  void handle(attach_request& msg);
  void handle(remove_request& msg);
  void handle(actor_down& msg);
  void handle(actor_up& msg);
  void handle(resolve_request& msg);
  void handle(list_request& msg);
  void handle(set_up_hook_request& msg);
  void handle(stop_request& msg);

  void shutdown();
  bool on_hub_thread() const { return std::this_thread::get_id() == hub_thread_.load(); }

  hub_config config_;
  bridge_spawner& spawner_;
  packet_handler default_handler_;

  mailbox<message> mailbox_;
  std::thread thread_;
  std::atomic<std::thread::id> hub_thread_;
  bool stopping_ = false;

  // Owned by the hub thread.
  std::map<device_id, std::shared_ptr<device_actor>> devices_;
  up_hook up_hook_;
};

} // namespace gdbhub
