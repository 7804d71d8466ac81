#include <doctest/doctest.h>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "fusionflex/transport/transport_udp.hpp"

using namespace fusionflex;
using namespace fusionflex::transport;

namespace {

// Plain blocking socket on 127.0.0.1 standing in for the network bridge.
struct Peer {
    int         fd{-1};
    sockaddr_in addr{};

    Peer() {
        fd = ::socket(AF_INET, SOCK_DGRAM, 0);
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        socklen_t len = sizeof(addr);
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);

        timeval tv{1, 0};
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }
    ~Peer() { if (fd >= 0) ::close(fd); }

    uint16_t port() const { return ntohs(addr.sin_port); }

    void send_to(const sockaddr_in& to, const std::string& s) const {
        ::sendto(fd, s.data(), s.size(), 0, reinterpret_cast<const sockaddr*>(&to), sizeof(to));
    }

    std::string recv(sockaddr_in& from) const {
        char buf[64];
        socklen_t len = sizeof(from);
        const ssize_t r = ::recvfrom(fd, buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&from), &len);
        return r > 0 ? std::string(buf, static_cast<size_t>(r)) : std::string();
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

void poll_for(UdpTransport& t, Listener& l, size_t want) {
    for (int i = 0; i < 100 && l.data.size() < want; ++i) {
        t.poll();
        if (l.data.size() < want) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

} // namespace

TEST_CASE("UDP transport talks only to its configured remote") {
    Peer bridge;
    Peer stranger;

    UdpEndpoint ep;
    ep.local_ip = "127.0.0.1";
    ep.remote_host = "127.0.0.1";
    ep.remote_port = bridge.port();

    UdpTransport t(ep);
    Listener l;
    REQUIRE(t.begin(l));
    CHECK(l.connected);
    CHECK(t.fd() >= 0);

    const std::string cmd = "'@112'";
    REQUIRE(t.send(reinterpret_cast<const uint8_t*>(cmd.data()), cmd.size()) == TxResult::Ok);

    sockaddr_in device_side{};
    CHECK(bridge.recv(device_side) == cmd);
    CHECK(t.is_expected_source(bridge.addr));
    CHECK_FALSE(t.is_expected_source(stranger.addr));

    stranger.send_to(device_side, "'@113'");
    bridge.send_to(device_side, "'@11Q'");
    poll_for(t, l, 6);

    CHECK(l.data == "'@11Q'");
    CHECK(l.lost.empty());

    t.end();
    CHECK(t.fd() == -1);
}

TEST_CASE("UDP transport refuses to open on a bad local address") {
    UdpEndpoint ep;
    ep.local_ip = "not-an-ip";
    ep.remote_host = "127.0.0.1";
    ep.remote_port = 9;

    UdpTransport t(ep);
    Listener l;
    CHECK_FALSE(t.begin(l));
    CHECK_FALSE(l.connected);
    CHECK(t.fd() == -1);
}
