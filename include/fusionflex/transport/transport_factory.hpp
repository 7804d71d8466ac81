#pragma once
/**
 * @file transport_factory.hpp
 * @brief Pick the concrete transport for a Connection descriptor.
 */

#include <memory>

#include "fusionflex/connection.hpp"
#include "fusionflex/transport/transport_base.hpp"

namespace fusionflex::transport {

/// LinuxSerial for a SerialEndpoint, UdpTransport for a UdpEndpoint. Not opened yet.
std::unique_ptr<ITransport> make_transport(const Connection& c);

} // namespace fusionflex::transport
