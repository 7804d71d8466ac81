/**
 * @file device.hpp
 * @brief FusionFlexDevice: connection lifetime + commands + status for one amplifier.
 *
 * @details
 * ## What this is
 * The facade a caller actually holds. It owns one transport, one reassembler
 * and the latest status snapshot, and stitches them together:
 *
 * ```
 *  caller ── turn_on() ──► command.hpp ── "'@112'" ──► ITransport::send()
 *
 *  ITransport::poll() ── bytes ──► Reassembler ── frames ──► apply_message()
 *                                                               │
 *        observers ◄── on_status_changed(snapshot) ◄── commit ──┘
 * ```
 *
 * ## Link states
 * ```
 *  Idle ──start()──► Starting ──on_connected──► Connected
 *                       │                          │
 *                       └── open failed ──┐        ├── stop()
 *                                         ▼        ├── transport lost
 *                                       Stopped ◄──┴── fatal send error
 * ```
 * - start() while Starting/Connected is a no-op returning Result::Ok.
 * - start() from Stopped opens a fresh connection instance: the reassembly
 *   buffer and the status snapshot start empty again.
 * - There is no reconnect logic. Whoever owns the device decides whether to
 *   call start() again after a loss.
 *
 * ## Threading
 * Single owner. poll() and every command must be called from the same thread
 * (the caller's event loop). Observers run synchronously inside poll().
 *
 * ## Errors
 * Commands return Result. Misuse (bad volume, unknown source, not connected)
 * is rejected before anything is written. Inbound junk never surfaces here;
 * it is logged and dropped.
 */
#ifndef FUSIONFLEX_DEVICE_HPP
#define FUSIONFLEX_DEVICE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "etl/vector.h"

#include "fusionflex/command.hpp"
#include "fusionflex/connection.hpp"
#include "fusionflex/reassembler.hpp"
#include "fusionflex/result.hpp"
#include "fusionflex/status.hpp"
#include "fusionflex/transport/transport_base.hpp"

namespace fusionflex {

enum class LinkState : uint8_t { Idle = 0, Starting, Connected, Stopped };

const char* to_string(LinkState s);

class FusionFlexDevice;

/**
 * @brief Subscriber interface for device events.
 *
 * on_status_changed() fires exactly once per accepted inbound frame, after the
 * new snapshot is visible through FusionFlexDevice::status().
 */
class DeviceObserver {
public:
  virtual ~DeviceObserver() = default;
  virtual void on_status_changed(const FusionFlexDevice& device, const StatusSnapshot& status) = 0;
  virtual void on_connection_lost(const FusionFlexDevice& device, const std::string& reason) {
    (void)device;
    (void)reason;
  }
};

/**
 * @brief Capability every controllable device type provides.
 */
class IDevice {
public:
  virtual ~IDevice() = default;
  virtual Result start() = 0;
  virtual void   stop() = 0;
  virtual const Connection& connection() const = 0;

  ConnectionType connection_type() const { return fusionflex::connection_type(connection()); }
};

class FusionFlexDevice : public IDevice, private transport::TransportListener {
public:
  /// Fixed observer capacity; subscribe() refuses beyond this.
  static constexpr size_t MAX_OBSERVERS = 8;

  /// Uses make_transport() to pick serial or UDP from @p conn.
  explicit FusionFlexDevice(Connection conn);

  /// Injects a transport (tests, custom links). @p transport must not be null.
  FusionFlexDevice(Connection conn, std::unique_ptr<transport::ITransport> transport);

  ~FusionFlexDevice() override;

  FusionFlexDevice(const FusionFlexDevice&) = delete;
  FusionFlexDevice& operator=(const FusionFlexDevice&) = delete;

  /// @name Lifetime
  ///@{
  Result start() override;
  void   stop() override;

  /// Service the transport once: read what is pending, run it through the engine.
  void poll();

  LinkState state() const { return state_; }
  bool is_connected() const { return state_ == LinkState::Connected; }
  const Connection& connection() const override { return conn_; }

  /// Descriptor to wait on in an outer poll(2) loop, -1 when not open.
  int fd() const;
  ///@}

  /// @name Commands (all fail with Result::NotConnected unless Connected)
  ///@{
  Result turn_on()     { return send_command(Command::PowerOn); }
  Result turn_off()    { return send_command(Command::PowerOff); }
  Result mute_on()     { return send_command(Command::MuteOn); }
  Result mute_off()    { return send_command(Command::MuteOff); }
  Result mute_toggle() { return send_command(Command::MuteToggle); }
  Result volume_up()   { return send_command(Command::VolumeUp); }
  Result volume_down() { return send_command(Command::VolumeDown); }

  Result set_volume_level_decibels(float decibels);

  /// @p fraction in [0,1]; Result::OutOfRange otherwise.
  Result set_volume_level_fraction(float fraction);

  Result select_input_source(SourceMode mode);

  Result send_command(Command cmd);
  ///@}

  /// @name Status
  ///@{
  /// Latest published snapshot; nullptr until the first accepted frame.
  StatusSnapshot status() const { return status_; }

  bool subscribe(DeviceObserver& observer);
  bool unsubscribe(DeviceObserver& observer);
  size_t observer_count() const { return observers_.size(); }
  ///@}

private:
  // TransportListener
  void on_connected() override;
  void on_data(const uint8_t* data, size_t len) override;
  void on_lost(const std::string& reason) override;

  Result send_wire(const std::string& wire);
  void   process_message(const std::string& msg);
  void   teardown();

  Connection                             conn_;
  std::unique_ptr<transport::ITransport> transport_;
  LinkState                              state_{LinkState::Idle};
  uint32_t                               generation_{0};   ///< bumped by every start()
  Reassembler                            reassembler_;
  StatusSnapshot                         status_;
  etl::vector<DeviceObserver*, MAX_OBSERVERS> observers_;
};

} // namespace fusionflex

#endif // FUSIONFLEX_DEVICE_HPP
