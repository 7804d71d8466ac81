// -----------------------------------------------------------------------------
// device.cpp: Implementation of FusionFlexDevice
//
// API, link-state diagram and threading rules: include/fusionflex/device.hpp
// Runnable scenarios against a fake transport: tests/test_device.cpp
//
// NOTE: this file is about *when* things happen (state guards, commit before
// notify, teardown order). What the bytes mean lives in command.cpp,
// reassembler.cpp and status.cpp.
// -----------------------------------------------------------------------------
#include "fusionflex/device.hpp"
#include "fusionflex/log.hpp"
#include "fusionflex/transport/transport_factory.hpp"
#include "fusionflex/volume.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace fusionflex {

const char* to_string(LinkState s) {
  switch (s) {
    case LinkState::Idle:      return "idle";
    case LinkState::Starting:  return "starting";
    case LinkState::Connected: return "connected";
    case LinkState::Stopped:   return "stopped";
  }
  return "unknown";
}

// ---------- construction ----------

FusionFlexDevice::FusionFlexDevice(Connection conn)
: conn_(std::move(conn)),
  transport_(transport::make_transport(conn_)) {
}

FusionFlexDevice::FusionFlexDevice(Connection conn, std::unique_ptr<transport::ITransport> transport)
: conn_(std::move(conn)),
  transport_(std::move(transport)) {
}

FusionFlexDevice::~FusionFlexDevice() {
  if (transport_) transport_->end();       // no callbacks into a dying object
}

// ---------- lifetime ----------

Result FusionFlexDevice::start() {
  if (state_ == LinkState::Starting || state_ == LinkState::Connected)
    return Result::Ok;                     // already up (or on its way)

  if (!transport_) return Result::TransportFailed;

  // fresh connection instance
  ++generation_;
  reassembler_.reset();
  status_.reset();
  state_ = LinkState::Starting;
  log::debug("starting {}", describe(conn_));

  if (!transport_->begin(*this)) {
    state_ = LinkState::Stopped;
    log::error("could not open {}", describe(conn_));
    return Result::TransportFailed;
  }
  return Result::Ok;
}

void FusionFlexDevice::stop() {
  if (state_ == LinkState::Idle || state_ == LinkState::Stopped) return;
  log::info("closing {}", describe(conn_));
  teardown();
}

void FusionFlexDevice::poll() {
  if (state_ != LinkState::Starting && state_ != LinkState::Connected) return;
  transport_->poll();
}

int FusionFlexDevice::fd() const {
  return transport_ ? transport_->fd() : -1;
}

void FusionFlexDevice::teardown() {
  state_ = LinkState::Stopped;
  if (transport_) transport_->end();
  reassembler_.reset();
  status_.reset();
}

// ---------- commands ----------

Result FusionFlexDevice::send_command(Command cmd) {
  return send_wire(wire_string(cmd));
}

Result FusionFlexDevice::set_volume_level_decibels(float decibels) {
  std::string wire;
  const Result r = encode_set_volume_db(decibels, wire);
  if (r != Result::Ok) return r;
  return send_wire(wire);
}

Result FusionFlexDevice::set_volume_level_fraction(float fraction) {
  const auto db = fraction_to_db(fraction);
  if (!db) return Result::OutOfRange;
  return set_volume_level_decibels(*db);
}

Result FusionFlexDevice::select_input_source(SourceMode mode) {
  Command cmd = Command::SelectInputAuto;
  const Result r = command_for_source(mode, cmd);
  if (r != Result::Ok) return r;
  return send_command(cmd);
}

// send_wire(): the only place bytes leave the device.
// Busy keeps the link; Error is terminal for this connection instance.
Result FusionFlexDevice::send_wire(const std::string& wire) {
  if (state_ != LinkState::Connected) return Result::NotConnected;

  log::debug("outgoing message to device: [{}]", wire);
  const auto tx = transport_->send(reinterpret_cast<const uint8_t*>(wire.data()), wire.size());
  switch (tx) {
    case transport::TxResult::Ok:
      return Result::Ok;
    case transport::TxResult::Busy:
      log::warn("transport {}: dropped command [{}]", transport::to_string(tx), wire);
      return Result::SendFailed;
    case transport::TxResult::Error:
      break;
  }
  on_lost(std::string("send failed: ") + transport::to_string(tx));
  return Result::TransportFailed;
}

// ---------- observers ----------

bool FusionFlexDevice::subscribe(DeviceObserver& observer) {
  if (std::find(observers_.begin(), observers_.end(), &observer) != observers_.end())
    return true;                           // already subscribed
  if (observers_.full()) return false;
  observers_.push_back(&observer);
  return true;
}

bool FusionFlexDevice::unsubscribe(DeviceObserver& observer) {
  auto it = std::find(observers_.begin(), observers_.end(), &observer);
  if (it == observers_.end()) return false;
  observers_.erase(it);
  return true;
}

// ---------- transport callbacks ----------

void FusionFlexDevice::on_connected() {
  if (state_ != LinkState::Starting) return;
  state_ = LinkState::Connected;
  log::info("connected {}", describe(conn_));
}

void FusionFlexDevice::on_data(const uint8_t* data, size_t len) {
  if (state_ != LinkState::Starting && state_ != LinkState::Connected) return;

  std::vector<std::string> frames;
  reassembler_.feed(data, len, frames);    // drops are logged inside; never fatal

  // An observer may stop (and even restart) the device mid-chunk. The rest of
  // this chunk belongs to the old connection instance either way.
  const uint32_t generation = generation_;
  for (const auto& msg : frames) {
    if (state_ == LinkState::Stopped || generation_ != generation) break;
    process_message(msg);
  }
}

void FusionFlexDevice::on_lost(const std::string& reason) {
  if (state_ == LinkState::Idle || state_ == LinkState::Stopped) return;
  log::warn("connection to {} lost: {}", describe(conn_), reason);
  teardown();

  // copy: an observer may unsubscribe itself while being notified
  const auto targets = observers_;
  for (DeviceObserver* o : targets) o->on_connection_lost(*this, reason);
}

// process_message(): state machine step, commit, then notify exactly once.
void FusionFlexDevice::process_message(const std::string& msg) {
  log::debug("incoming message from device: [{}]", msg);

  auto next = apply_message(status_.get(), msg);
  if (!next) return;                       // unknown: already logged, no publish

  status_ = std::make_shared<const DeviceStatus>(*next);

  const StatusSnapshot published = status_;
  const auto targets = observers_;
  for (DeviceObserver* o : targets) o->on_status_changed(*this, published);
}

} // namespace fusionflex
