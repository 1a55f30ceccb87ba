#include "lumen/net/endpoint.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace lumen::net;

TEST(Endpoint, ParseAddressAndPort) {
    const auto ep = Endpoint::parse("192.168.1.20:56701");
    EXPECT_EQ(ep.address, 0xC0A80114u);
    EXPECT_EQ(ep.port, 56701);
}

TEST(Endpoint, ParseWithoutPortUsesDefault) {
    const auto ep = Endpoint::parse("10.0.0.1");
    EXPECT_EQ(ep.address, 0x0A000001u);
    EXPECT_EQ(ep.port, kLifxPort);
}

TEST(Endpoint, ParseRejectsGarbage) {
    EXPECT_THROW(Endpoint::parse("not-an-ip"), std::invalid_argument);
    EXPECT_THROW(Endpoint::parse("10.0.0.1:"), std::invalid_argument);
    EXPECT_THROW(Endpoint::parse("10.0.0.1:70000"), std::invalid_argument);
    EXPECT_THROW(Endpoint::parse("10.0.0.1:12ab"), std::invalid_argument);
}

TEST(Endpoint, Broadcast) {
    const auto ep = Endpoint::broadcast();
    EXPECT_EQ(ep.to_string(), "255.255.255.255:56700");
}

TEST(Endpoint, ToStringAndWithPort) {
    const auto ep = Endpoint::parse("127.0.0.1:9").with_port(56700);
    EXPECT_EQ(ep.address_string(), "127.0.0.1");
    EXPECT_EQ(ep.to_string(), "127.0.0.1:56700");
}
