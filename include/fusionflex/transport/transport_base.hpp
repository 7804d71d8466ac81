#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal, protocol-agnostic transport interface for fusionflex devices.
 *
 * The device facade never touches a file descriptor. It talks to an
 * ITransport, and the transport talks back through a TransportListener.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace fusionflex::transport {

// Return codes kept simple; the facade only needs to tell these apart.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };

const char* to_string(TxResult r);

/**
 * @brief Callbacks a transport raises. Always called from inside begin() or
 *        poll(), on the caller's thread.
 */
class TransportListener {
public:
  virtual ~TransportListener() = default;
  virtual void on_connected() = 0;
  virtual void on_data(const uint8_t* data, std::size_t len) = 0;
  virtual void on_lost(const std::string& reason) = 0;
};

/**
 * @brief Transport trait every concrete link implements.
 *
 * Contract:
 *  - begin(listener) opens the port/socket and reports on_connected() before
 *    returning true. Returns false (and reports nothing) on failure.
 *  - poll() is non-blocking: drains whatever is readable into on_data() and
 *    reports on_lost() if the link died. Does nothing when closed.
 *  - send(buf,len) writes one command; never blocks (returns Busy instead).
 *  - end() closes; safe to call repeatedly. No callbacks after end().
 *  - fd() exposes the descriptor for an outer poll(2) loop, -1 when closed.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool        begin(TransportListener& listener) = 0;
  virtual void        end() = 0;
  virtual void        poll() = 0;
  virtual TxResult    send(const uint8_t* data, std::size_t len) = 0;
  virtual const char* name() const = 0;
  virtual int         fd() const = 0;
};

} // namespace fusionflex::transport
