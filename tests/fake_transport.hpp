#pragma once
// In-memory ITransport for facade tests: records writes, lets the test inject
// inbound chunks and link loss, and can be told to fail open or writes.

#include <string>
#include <vector>

#include "fusionflex/transport/transport_base.hpp"

namespace fusionflex::test {

class FakeTransport : public transport::ITransport {
public:
  // knobs
  bool                  fail_begin{false};
  bool                  connect_on_begin{true};
  transport::TxResult   next_tx{transport::TxResult::Ok};

  // observations
  int                       begin_calls{0};
  int                       end_calls{0};
  std::vector<std::string>  sent;

  bool begin(transport::TransportListener& l) override {
    ++begin_calls;
    if (fail_begin) return false;
    listener_ = &l;
    open_ = true;
    if (connect_on_begin) listener_->on_connected();
    return true;
  }

  void end() override {
    ++end_calls;
    open_ = false;
    listener_ = nullptr;
  }

  void poll() override {
    std::vector<std::string> chunks;
    chunks.swap(inbound_);
    for (const auto& c : chunks) {
      if (!open_ || !listener_) return;
      listener_->on_data(reinterpret_cast<const uint8_t*>(c.data()), c.size());
    }
  }

  transport::TxResult send(const uint8_t* data, std::size_t len) override {
    if (next_tx == transport::TxResult::Ok)
      sent.emplace_back(reinterpret_cast<const char*>(data), len);
    return next_tx;
  }

  const char* name() const override { return "fake"; }
  int fd() const override { return open_ ? 42 : -1; }

  // test drivers
  void queue(const std::string& chunk) { inbound_.push_back(chunk); }

  void connect() { if (listener_) listener_->on_connected(); }

  void drop(const std::string& reason) {
    auto* l = listener_;
    open_ = false;
    listener_ = nullptr;
    if (l) l->on_lost(reason);
  }

  bool is_open() const { return open_; }

private:
  transport::TransportListener* listener_{nullptr};
  bool                          open_{false};
  std::vector<std::string>      inbound_;
};

} // namespace fusionflex::test
