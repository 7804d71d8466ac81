// ============================================================================
// transport_udp.cpp: implementation for transport_udp.hpp
// ============================================================================

#include "fusionflex/transport/transport_udp.hpp"
#include "fusionflex/log.hpp"

#include <arpa/inet.h>     // inet_pton / inet_ntop
#include <fcntl.h>
#include <netdb.h>         // getaddrinfo
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace fusionflex::transport {

// Resolve the remote host to an IPv4 address. Names go through the resolver,
// dotted quads come straight back.
static bool resolve_ipv4(const std::string& host, uint16_t port, sockaddr_in& out) {
  addrinfo hints{};
  hints.ai_family   = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;

  addrinfo* res = nullptr;
  const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
  if (rc != 0 || !res) {
    log::error("resolve failed host={} err={}", host, ::gai_strerror(rc));
    return false;
  }
  std::memcpy(&out, res->ai_addr, sizeof(sockaddr_in));
  out.sin_port = htons(port);
  ::freeaddrinfo(res);
  return true;
}

static std::string endpoint_str(const sockaddr_in& a) {
  char ip[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &a.sin_addr, ip, sizeof(ip));
  return std::string(ip) + ":" + std::to_string(ntohs(a.sin_port));
}

bool UdpTransport::begin(TransportListener& listener) {
  end();

  std::memset(&remote_, 0, sizeof(remote_));
  if (!resolve_ipv4(ep_.remote_host, ep_.remote_port, remote_)) return false;

  sockaddr_in local{};
  local.sin_family = AF_INET;
  local.sin_port   = htons(ep_.local_port);
  if (::inet_pton(AF_INET, ep_.local_ip.c_str(), &local.sin_addr) != 1) {
    log::error("bad local address ip={}", ep_.local_ip);
    return false;
  }

  fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd_ < 0) {
    log::error("socket() failed: {}", std::strerror(errno));
    return false;
  }

  if (::bind(fd_, reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
    log::error("bind() failed ip={} port={} err={}", ep_.local_ip, ep_.local_port, std::strerror(errno));
    ::close(fd_);
    fd_ = -1;
    return false;
  }

  const int flags = ::fcntl(fd_, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
    log::error("fcntl(O_NONBLOCK) failed: {}", std::strerror(errno));
    ::close(fd_);
    fd_ = -1;
    return false;
  }

  listener_ = &listener;
  log::info("connected to udp remote={}", endpoint_str(remote_));
  listener_->on_connected();
  return true;
}

void UdpTransport::end() {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  listener_ = nullptr;
}

bool UdpTransport::is_expected_source(const sockaddr_in& from) const {
  return from.sin_family == AF_INET &&
         from.sin_addr.s_addr == remote_.sin_addr.s_addr &&
         from.sin_port == remote_.sin_port;
}

void UdpTransport::poll() {
  uint8_t buf[RX_DATAGRAM_MAX];
  while (fd_ >= 0) {
    sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    const ssize_t r = ::recvfrom(fd_, buf, sizeof(buf), 0,
                                 reinterpret_cast<sockaddr*>(&from), &from_len);
    if (r < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) return;
      // ICMP port unreachable from an earlier sendto; the socket itself is fine
      if (errno == ECONNREFUSED) {
        log::warn("udp remote={} refused a datagram", endpoint_str(remote_));
        continue;
      }
      fail(std::string("recvfrom failed: ") + std::strerror(errno));
      return;
    }

    if (!is_expected_source(from)) {
      log::debug("received data from unexpected source {}: \"{}\"",
                 endpoint_str(from), std::string(reinterpret_cast<const char*>(buf), static_cast<size_t>(r)));
      continue;
    }
    if (r > 0 && listener_) listener_->on_data(buf, static_cast<std::size_t>(r));
  }
}

TxResult UdpTransport::send(const uint8_t* data, std::size_t len) {
  if (fd_ < 0 || !data || !len) return TxResult::Error;
  const ssize_t w = ::sendto(fd_, data, len, 0,
                             reinterpret_cast<const sockaddr*>(&remote_), sizeof(remote_));
  if (w < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ENOBUFS) return TxResult::Busy;
    log::error("sendto failed remote={} err={}", endpoint_str(remote_), std::strerror(errno));
    return TxResult::Error;
  }
  return TxResult::Ok;
}

void UdpTransport::fail(const std::string& reason) {
  TransportListener* l = listener_;
  end();
  if (l) l->on_lost(reason);
}

} // namespace fusionflex::transport
