#pragma once

#include "lumen/net/endpoint.hpp"
#include "lumen/protocol/message.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lumen::client {

/// Follow-up requests sent to every known device on each discovery tick.
enum class DiscoverOption : uint32_t {
    None = 0,
    Label = 1u << 0,
    Power = 1u << 1,
    Location = 1u << 2,
    Group = 1u << 3,
    HostInfo = 1u << 4,
    HostFirmware = 1u << 5,
    WifiFirmware = 1u << 6,
    All = (1u << 7) - 1,
};

constexpr DiscoverOption operator|(DiscoverOption a, DiscoverOption b) {
    return static_cast<DiscoverOption>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

constexpr DiscoverOption operator&(DiscoverOption a, DiscoverOption b) {
    return static_cast<DiscoverOption>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

constexpr bool has_option(DiscoverOption set, DiscoverOption flag) {
    return (set & flag) != DiscoverOption::None;
}

/// Config-file name of a single option ("label", "host_info", ...).
const char *discover_option_name(DiscoverOption option);

/// Throws ConfigError for an unknown name.
DiscoverOption discover_option_from_name(std::string_view name);

struct ClientConfig {
    net::Endpoint bind{0, net::kLifxPort};
    net::Endpoint broadcast = net::Endpoint::broadcast();
    uint32_t source = protocol::kDefaultSource;
    std::chrono::milliseconds read_timeout{500};
    std::chrono::milliseconds write_timeout{500};
    std::chrono::milliseconds discover_interval{1000};
    std::chrono::milliseconds request_delay{50};
    DiscoverOption discover_options = DiscoverOption::All;
    bool log_traffic = false;
};

/// Parse a client configuration object. Missing keys keep their defaults.
/// Expects: {"bind": "0.0.0.0:56700", "broadcast": "...", "source": 1014,
///           "read_timeout_ms": 500, "write_timeout_ms": 500,
///           "discover_interval_ms": 1000, "request_delay_ms": 50,
///           "discover": ["label", "power"] | "all" | "none", "log_traffic": false}
ClientConfig parse_client_config(const nlohmann::json &doc);

/// Read and parse a JSON configuration file. Throws ConfigError.
ClientConfig load_client_config(const std::string &path);

nlohmann::json to_json(const ClientConfig &config);

} // namespace lumen::client
