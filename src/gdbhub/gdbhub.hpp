#pragma once

#include <string_view>

#include "gdbhub/bridge/bridge.hpp"
#include "gdbhub/bridge/process_bridge.hpp"
#include "gdbhub/config.hpp"
#include "gdbhub/device/device.hpp"
#include "gdbhub/device/identity.hpp"
#include "gdbhub/hub/hub.hpp"
#include "gdbhub/log.hpp"
#include "gdbhub/protocol/framing.hpp"
#include "gdbhub/protocol/rsp_core.hpp"
#include "gdbhub/protocol/tags.hpp"
#include "gdbhub/server/debug_server.hpp"
#include "gdbhub/transport/transport_tcp.hpp"

namespace gdbhub {

std::string_view version();

} // namespace gdbhub
