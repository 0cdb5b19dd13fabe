#include "gdbhub/gdbhub.hpp"

#ifndef GDBHUB_VERSION
#define GDBHUB_VERSION "0.0.0"
#endif

namespace gdbhub {

std::string_view version() { return GDBHUB_VERSION; }

} // namespace gdbhub
