#include "lumen/net/udp_socket.hpp"

#include "lumen/error.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <memory>
#include <vector>

using namespace lumen;
using namespace lumen::net;
using namespace std::chrono_literals;

namespace {

std::unique_ptr<UdpSocket> bind_loopback() {
    return UdpSocket::bind(Endpoint::parse("127.0.0.1:0"), 200ms, 200ms);
}

} // namespace

TEST(UdpSocket, BindsEphemeralPort) {
    const auto sock = bind_loopback();
    const auto local = sock->local_endpoint();
    EXPECT_EQ(local.address_string(), "127.0.0.1");
    EXPECT_NE(local.port, 0);
}

TEST(UdpSocket, EachBindOwnsADistinctSocket) {
    const auto first = bind_loopback();
    const auto second = bind_loopback();
    EXPECT_NE(first->local_endpoint().port, second->local_endpoint().port);
}

TEST(UdpSocket, LoopbackSendAndReceive) {
    const auto sender = bind_loopback();
    const auto receiver = bind_loopback();

    const std::vector<uint8_t> payload = {0x24, 0x00, 0x00, 0x34};
    EXPECT_EQ(sender->send_to(payload, receiver->local_endpoint()), payload.size());

    std::array<uint8_t, 64> buffer{};
    const auto datagram = receiver->recv_from(buffer);
    ASSERT_TRUE(datagram.has_value());
    EXPECT_EQ(datagram->size, payload.size());
    EXPECT_EQ(datagram->from, sender->local_endpoint());
    EXPECT_TRUE(std::equal(payload.begin(), payload.end(), buffer.begin()));
}

TEST(UdpSocket, ReceiveTimesOut) {
    const auto sock = bind_loopback();
    std::array<uint8_t, 16> buffer{};

    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(sock->recv_from(buffer).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 150ms);
}

TEST(UdpSocket, BroadcastFlagTracksOption) {
    const auto sock = bind_loopback();
    EXPECT_FALSE(sock->broadcast());
    sock->set_broadcast(true);
    EXPECT_TRUE(sock->broadcast());
    sock->set_broadcast(false);
    EXPECT_FALSE(sock->broadcast());
}
