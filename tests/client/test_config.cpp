#include "lumen/client/config.hpp"

#include "lumen/error.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

using namespace lumen;
using namespace lumen::client;

TEST(ClientConfig, Defaults) {
    const ClientConfig config;
    EXPECT_EQ(config.bind.to_string(), "0.0.0.0:56700");
    EXPECT_EQ(config.broadcast.to_string(), "255.255.255.255:56700");
    EXPECT_EQ(config.source, 1014u);
    EXPECT_EQ(config.read_timeout.count(), 500);
    EXPECT_EQ(config.discover_interval.count(), 1000);
    EXPECT_EQ(config.discover_options, DiscoverOption::All);
    EXPECT_FALSE(config.log_traffic);
}

TEST(ClientConfig, EmptyObjectKeepsDefaults) {
    const auto config = parse_client_config(nlohmann::json::object());
    EXPECT_EQ(config.request_delay.count(), 50);
    EXPECT_EQ(config.discover_options, DiscoverOption::All);
}

TEST(ClientConfig, ParsesAllKeys) {
    const auto doc = nlohmann::json::parse(R"({
        "bind": "127.0.0.1:0",
        "broadcast": "192.168.1.255",
        "source": 77,
        "read_timeout_ms": 100,
        "write_timeout_ms": 200,
        "discover_interval_ms": 5000,
        "request_delay_ms": 0,
        "discover": ["label", "power"],
        "log_traffic": true
    })");
    const auto config = parse_client_config(doc);

    EXPECT_EQ(config.bind.to_string(), "127.0.0.1:0");
    EXPECT_EQ(config.broadcast.to_string(), "192.168.1.255:56700");
    EXPECT_EQ(config.source, 77u);
    EXPECT_EQ(config.read_timeout.count(), 100);
    EXPECT_EQ(config.write_timeout.count(), 200);
    EXPECT_EQ(config.discover_interval.count(), 5000);
    EXPECT_EQ(config.request_delay.count(), 0);
    EXPECT_EQ(config.discover_options, DiscoverOption::Label | DiscoverOption::Power);
    EXPECT_TRUE(config.log_traffic);
}

TEST(ClientConfig, DiscoverKeywords) {
    EXPECT_EQ(parse_client_config({{"discover", "none"}}).discover_options, DiscoverOption::None);
    EXPECT_EQ(parse_client_config({{"discover", "all"}}).discover_options, DiscoverOption::All);
    EXPECT_EQ(parse_client_config({{"discover", "group"}}).discover_options,
              DiscoverOption::Group);
}

TEST(ClientConfig, RejectsBadValues) {
    EXPECT_THROW(parse_client_config(nlohmann::json::array()), ConfigError);
    EXPECT_THROW(parse_client_config({{"bind", "nope"}}), ConfigError);
    EXPECT_THROW(parse_client_config({{"bind", 5}}), ConfigError);
    EXPECT_THROW(parse_client_config({{"source", -1}}), ConfigError);
    EXPECT_THROW(parse_client_config({{"source", 4294967296ull}}), ConfigError);
    EXPECT_THROW(parse_client_config({{"read_timeout_ms", 0}}), ConfigError);
    EXPECT_THROW(parse_client_config({{"request_delay_ms", -5}}), ConfigError);
    EXPECT_THROW(parse_client_config({{"discover_interval_ms", "fast"}}), ConfigError);
    EXPECT_THROW(parse_client_config({{"discover", {"label", "colour"}}}), ConfigError);
    EXPECT_THROW(parse_client_config({{"log_traffic", 1}}), ConfigError);
}

TEST(ClientConfig, OptionNames) {
    EXPECT_STREQ(discover_option_name(DiscoverOption::HostFirmware), "host_firmware");
    EXPECT_EQ(discover_option_from_name("wifi_firmware"), DiscoverOption::WifiFirmware);
    EXPECT_THROW(discover_option_from_name("bogus"), ConfigError);
}

TEST(ClientConfig, ToJsonRoundTrips) {
    ClientConfig config;
    config.source = 9;
    config.discover_options = DiscoverOption::Location | DiscoverOption::Group;
    const auto reparsed = parse_client_config(to_json(config));
    EXPECT_EQ(reparsed.source, 9u);
    EXPECT_EQ(reparsed.discover_options, config.discover_options);
    EXPECT_EQ(reparsed.bind, config.bind);
}

TEST(ClientConfig, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "lumen_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"source": 5, "discover": "none"})";
    }
    const auto config = load_client_config(path);
    EXPECT_EQ(config.source, 5u);
    EXPECT_EQ(config.discover_options, DiscoverOption::None);
    std::remove(path.c_str());
}

TEST(ClientConfig, LoadMissingOrInvalidFileThrows) {
    EXPECT_THROW(load_client_config("/nonexistent/lumen.json"), ConfigError);

    const std::string path = ::testing::TempDir() + "lumen_bad_config.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(load_client_config(path), ConfigError);
    std::remove(path.c_str());
}
