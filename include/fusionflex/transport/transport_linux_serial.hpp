#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux tty transport (termios raw mode, 8N1, non-blocking).
 *
 * Depends on: unistd.h, fcntl.h, termios.h (in the .cpp).
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "fusionflex/connection.hpp"
#include "fusionflex/transport/transport_base.hpp"

#include <string>
#include <utility>

namespace fusionflex::transport {

class LinuxSerial : public ITransport {
public:
  /// How long send() waits for the rest of a frame once part of it is out.
  static constexpr int WRITE_DRAIN_MS = 100;

  explicit LinuxSerial(SerialEndpoint ep) : ep_(std::move(ep)) {}
  ~LinuxSerial() override { end(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  bool        begin(TransportListener& listener) override;
  void        end() override;
  void        poll() override;
  TxResult    send(const uint8_t* data, std::size_t len) override;
  const char* name() const override { return "linux-serial"; }
  int         fd() const override { return fd_; }

  const SerialEndpoint& endpoint() const { return ep_; }

private:
  bool hung_up() const;
  void fail(const std::string& reason);

  SerialEndpoint     ep_;
  int                fd_{-1};
  TransportListener* listener_{nullptr};
};

} // namespace fusionflex::transport
