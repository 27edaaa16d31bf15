#pragma once

#include <string_view>

#include "h2mux/base-fd.hpp"

namespace h2mux {

// Resolve host:port and connect (blocking) to the first reachable returned address.
// Returns the connected socket, with TCP_NODELAY set.
// Throws std::system_error if resolution fails or no address could be connected to.
// family defaults to 0 (AF_UNSPEC).
BaseFd ConnectTCP(std::string_view host, std::string_view port, int family = 0);

}  // namespace h2mux
