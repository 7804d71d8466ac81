#include <doctest/doctest.h>
#include <cerrno>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <pty.h>
#include <unistd.h>

#include "fusionflex/device.hpp"
#include "fusionflex/transport/transport_linux_serial.hpp"

using namespace fusionflex;
using namespace fusionflex::transport;

namespace {

// Pseudo-terminal pair: the transport opens the slave by path, the test plays
// the amplifier on the master side.
struct Pty {
    int  master{-1};
    int  slave{-1};
    char name[128] = {0};

    Pty() {
        REQUIRE(::openpty(&master, &slave, name, nullptr, nullptr) == 0);
        ::fcntl(master, F_SETFL, ::fcntl(master, F_GETFL, 0) | O_NONBLOCK);
    }
    ~Pty() {
        close_master();
        if (slave >= 0) ::close(slave);
    }

    void close_master() {
        if (master >= 0) { ::close(master); master = -1; }
    }

    void write(const std::string& s) const {
        REQUIRE(::write(master, s.data(), s.size()) == static_cast<ssize_t>(s.size()));
    }

    // Everything the slave side has written so far; gives the line discipline
    // a moment to hand data over.
    std::string drain() const {
        std::string out;
        char buf[4096];
        for (int idle = 0; idle < 10;) {
            const ssize_t r = ::read(master, buf, sizeof(buf));
            if (r > 0) { out.append(buf, static_cast<size_t>(r)); idle = 0; continue; }
            ++idle;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return out;
    }
};

struct Listener : TransportListener {
    bool                     connected{false};
    std::string              data;
    std::vector<std::string> lost;

    void on_connected() override { connected = true; }
    void on_data(const uint8_t* d, std::size_t n) override { data.append(reinterpret_cast<const char*>(d), n); }
    void on_lost(const std::string& r) override { lost.push_back(r); }
};

void poll_for(LinuxSerial& s, Listener& l, size_t want) {
    for (int i = 0; i < 100 && l.data.size() < want; ++i) {
        s.poll();
        if (l.data.size() < want) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

TxResult send(LinuxSerial& s, const std::string& frame) {
    return s.send(reinterpret_cast<const uint8_t*>(frame.data()), frame.size());
}

} // namespace

TEST_CASE("Serial transport opens a tty and moves bytes both ways") {
    Pty pty;
    LinuxSerial s(SerialEndpoint{pty.name, SERIAL_DEFAULT_BAUD});
    Listener l;

    REQUIRE(s.begin(l));
    CHECK(l.connected);
    CHECK(s.fd() >= 0);

    pty.write("'@112'");
    poll_for(s, l, 6);
    CHECK(l.data == "'@112'");

    CHECK(send(s, "'@11Q'") == TxResult::Ok);
    CHECK(pty.drain() == "'@11Q'");

    // idle line: nothing to read is not a loss
    s.poll();
    CHECK(l.lost.empty());
    CHECK(s.fd() >= 0);
}

TEST_CASE("Serial transport reports a hung-up line exactly once") {
    Pty pty;
    LinuxSerial s(SerialEndpoint{pty.name, SERIAL_DEFAULT_BAUD});
    Listener l;
    REQUIRE(s.begin(l));

    pty.close_master();
    s.poll();

    REQUIRE(l.lost.size() == 1);
    CHECK(s.fd() == -1);

    s.poll();
    CHECK(l.lost.size() == 1);
    CHECK(send(s, "'@112'") == TxResult::Error);
}

TEST_CASE("Serial transport refuses a port that does not exist") {
    LinuxSerial s(SerialEndpoint{"/dev/fusionflex-no-such-port", SERIAL_DEFAULT_BAUD});
    Listener l;
    CHECK_FALSE(s.begin(l));
    CHECK_FALSE(l.connected);
    CHECK(s.fd() == -1);
}

TEST_CASE("A full output queue never leaves half a frame behind") {
    Pty pty;
    LinuxSerial s(SerialEndpoint{pty.name, SERIAL_DEFAULT_BAUD});
    Listener l;
    REQUIRE(s.begin(l));

    const std::string frame = "'@11P-47.5'";
    size_t   ok   = 0;
    TxResult last = TxResult::Ok;
    for (int i = 0; i < 200000 && last == TxResult::Ok; ++i) {
        last = send(s, frame);
        if (last == TxResult::Ok) ++ok;
    }
    REQUIRE(last != TxResult::Ok);

    const size_t total = pty.drain().size();
    if (last == TxResult::Busy) {
        // refused before the first byte: only whole frames went out
        CHECK(total == ok * frame.size());
    } else {
        // a frame started and could not finish: reported as a link error
        CHECK(total > ok * frame.size());
        CHECK(total < (ok + 1) * frame.size());
    }
}

TEST_CASE("Unplugging the serial line stops the device and tells observers") {
    struct LossRecorder : DeviceObserver {
        int statuses{0};
        std::vector<std::string> lost;
        void on_status_changed(const FusionFlexDevice&, const StatusSnapshot&) override { ++statuses; }
        void on_connection_lost(const FusionFlexDevice&, const std::string& reason) override {
            lost.push_back(reason);
        }
    };

    Pty pty;
    FusionFlexDevice dev(SerialEndpoint{pty.name, SERIAL_DEFAULT_BAUD});
    LossRecorder rec;
    dev.subscribe(rec);
    REQUIRE(dev.start() == Result::Ok);
    REQUIRE(dev.is_connected());

    pty.write("'@112'");
    for (int i = 0; i < 100 && rec.statuses == 0; ++i) {
        dev.poll();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    CHECK(rec.statuses == 1);

    pty.close_master();
    dev.poll();

    CHECK(dev.state() == LinkState::Stopped);
    REQUIRE(rec.lost.size() == 1);
    CHECK(dev.turn_on() == Result::NotConnected);
}
