#include "fusionflex/transport/transport_factory.hpp"
#include "fusionflex/transport/transport_linux_serial.hpp"
#include "fusionflex/transport/transport_udp.hpp"

namespace fusionflex::transport {

const char* to_string(TxResult r) {
  switch (r) {
    case TxResult::Ok:    return "ok";
    case TxResult::Busy:  return "busy";
    case TxResult::Error: return "error";
  }
  return "unknown";
}

std::unique_ptr<ITransport> make_transport(const Connection& c) {
  if (const auto* s = std::get_if<SerialEndpoint>(&c))
    return std::make_unique<LinuxSerial>(*s);
  return std::make_unique<UdpTransport>(std::get<UdpEndpoint>(c));
}

} // namespace fusionflex::transport
