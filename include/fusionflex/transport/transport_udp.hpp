#pragma once
/**
 * @file transport_udp.hpp
 * @brief UDP datagram transport for network-to-serial bridges.
 *
 * Binds local_ip:local_port, sends every command as one datagram to
 * remote_host:remote_port, and only accepts datagrams coming back from that
 * same endpoint. Anything else arriving on the socket is logged at debug
 * level and dropped before it reaches the protocol engine.
 */

#include "fusionflex/connection.hpp"
#include "fusionflex/transport/transport_base.hpp"

#include <netinet/in.h>
#include <string>
#include <utility>

namespace fusionflex::transport {

class UdpTransport : public ITransport {
public:
  /// Largest datagram read in one go; device frames are far smaller.
  static constexpr std::size_t RX_DATAGRAM_MAX = 512;

  explicit UdpTransport(UdpEndpoint ep) : ep_(std::move(ep)) {}
  ~UdpTransport() override { end(); }

  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  bool        begin(TransportListener& listener) override;
  void        end() override;
  void        poll() override;
  TxResult    send(const uint8_t* data, std::size_t len) override;
  const char* name() const override { return "udp"; }
  int         fd() const override { return fd_; }

  const UdpEndpoint& endpoint() const { return ep_; }

  /// True if @p from is the configured remote endpoint (address and port).
  bool is_expected_source(const sockaddr_in& from) const;

private:
  void fail(const std::string& reason);

  UdpEndpoint        ep_;
  int                fd_{-1};
  sockaddr_in        remote_{};
  TransportListener* listener_{nullptr};
};

} // namespace fusionflex::transport
