// ============================================================================
// transport_linux_serial.cpp: implementation for transport_linux_serial.hpp
// The amplifier's rear RS-232 port runs 9600 baud, 8N1, no flow control.
// ============================================================================

#include "fusionflex/transport/transport_linux_serial.hpp"
#include "fusionflex/log.hpp"

#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, O_NONBLOCK)
#include <unistd.h>        // ::read, ::write, ::close
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // hangup check, write drain
#include <cerrno>
#include <cstring>         // strerror

namespace fusionflex::transport {

// ---------------------------------------------------------------------------
// baud_to_speed()
// ---------------
// Map the integer baud to a termios constant. Unknown values fall back to
// 9600, the only rate the Fusion Flex ships with.
// ---------------------------------------------------------------------------
static speed_t baud_to_speed(int baud) {
  switch (baud) {
    case 1200:   return B1200;
    case 2400:   return B2400;
    case 4800:   return B4800;
    case 9600:   return B9600;
    case 19200:  return B19200;
    case 38400:  return B38400;
    case 57600:  return B57600;
    case 115200: return B115200;
#ifdef B230400
    case 230400: return B230400;
#endif
    default:     return B9600;
  }
}

// ---------------------------------------------------------------------------
// set_raw()
// ---------
// Raw 8N1: no echo, no line discipline, no hardware flow control, VMIN/VTIME
// zero so reads never wait (the fd is O_NONBLOCK anyway).
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t sp) {
  termios tio{};
  if (::tcgetattr(fd, &tio) != 0) return false;

  ::cfmakeraw(&tio);                            // 8 data bits, no parity
  ::cfsetispeed(&tio, sp);
  ::cfsetospeed(&tio, sp);

  tio.c_cflag |= (CLOCAL | CREAD);              // ignore modem ctrl, enable read
  tio.c_cflag &= ~CSTOPB;                       // one stop bit
  tio.c_cflag &= ~CRTSCTS;                      // no hardware flow control
  tio.c_cc[VMIN]  = 0;
  tio.c_cc[VTIME] = 0;

  if (::tcsetattr(fd, TCSANOW, &tio) != 0) return false;
  ::tcflush(fd, TCIOFLUSH);                     // discard anything stale
  return true;
}

bool LinuxSerial::begin(TransportListener& listener) {
  end();
  if (ep_.port.empty()) {
    log::error("serial open failed: no port configured");
    return false;
  }

  fd_ = ::open(ep_.port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    log::error("serial open failed dev={} err={}", ep_.port, std::strerror(errno));
    return false;
  }

  if (!set_raw(fd_, baud_to_speed(ep_.baud))) {
    log::error("serial configure failed dev={} err={}", ep_.port, std::strerror(errno));
    ::close(fd_);
    fd_ = -1;
    return false;
  }

  listener_ = &listener;
  log::info("connected to serial dev={} baud={}", ep_.port, ep_.baud);
  listener_->on_connected();
  return true;
}

void LinuxSerial::end() {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  listener_ = nullptr;
}

// Drain everything readable right now. Stops on EAGAIN, or as soon as a
// callback closed us (fd_ < 0).
void LinuxSerial::poll() {
  uint8_t buf[256];
  while (fd_ >= 0) {
    const ssize_t r = ::read(fd_, buf, sizeof(buf));
    if (r > 0) {
      if (listener_) listener_->on_data(buf, static_cast<std::size_t>(r));
      continue;
    }
    if (r == 0) {
      // VMIN=0/VTIME=0: 0 means "nothing pending" and also "hung up".
      if (hung_up()) fail("hangup");
      return;
    }
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return;
    fail(std::string("read failed: ") + std::strerror(errno));
    return;
  }
}

bool LinuxSerial::hung_up() const {
  pollfd p{fd_, POLLIN, 0};
  if (::poll(&p, 1, 0) <= 0) return false;
  return (p.revents & (POLLHUP | POLLERR | POLLNVAL)) != 0;
}

// ---------------------------------------------------------------------------
// send()
// ------
// Nothing written yet and the driver queue is full: Busy, the caller may retry.
// Once the first byte is out the frame must finish, or the next command would
// be glued onto half a frame. Wait up to WRITE_DRAIN_MS for room; if the rest
// still does not fit, report Error so the link is torn down.
// ---------------------------------------------------------------------------
TxResult LinuxSerial::send(const uint8_t* data, std::size_t len) {
  if (fd_ < 0 || !data || !len) return TxResult::Error;

  std::size_t done = 0;
  while (done < len) {
    const ssize_t w = ::write(fd_, data + done, len - done);
    if (w > 0) { done += static_cast<std::size_t>(w); continue; }

    if (w < 0 && errno == EINTR) continue;
    if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
      log::error("serial write failed dev={} err={}", ep_.port, std::strerror(errno));
      return TxResult::Error;
    }
    if (done == 0) return TxResult::Busy;

    pollfd p{fd_, POLLOUT, 0};
    if (::poll(&p, 1, WRITE_DRAIN_MS) <= 0 || !(p.revents & POLLOUT)) {
      log::error("serial write stalled dev={} sent={} of {}", ep_.port, done, len);
      return TxResult::Error;
    }
  }
  return TxResult::Ok;
}

void LinuxSerial::fail(const std::string& reason) {
  TransportListener* l = listener_;
  end();
  if (l) l->on_lost(reason);
}

} // namespace fusionflex::transport
