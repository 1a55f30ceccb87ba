#include "lumen/client/config.hpp"

#include "lumen/error.hpp"

#include <array>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace lumen::client {

namespace {

constexpr std::array<std::pair<DiscoverOption, const char *>, 7> kOptionNames = {{
    {DiscoverOption::Label, "label"},
    {DiscoverOption::Power, "power"},
    {DiscoverOption::Location, "location"},
    {DiscoverOption::Group, "group"},
    {DiscoverOption::HostInfo, "host_info"},
    {DiscoverOption::HostFirmware, "host_firmware"},
    {DiscoverOption::WifiFirmware, "wifi_firmware"},
}};

net::Endpoint endpoint_field(const nlohmann::json &doc, const char *key, net::Endpoint fallback) {
    if (!doc.contains(key)) {
        return fallback;
    }
    if (!doc[key].is_string()) {
        throw ConfigError(std::string("'") + key + "' must be a string");
    }
    try {
        return net::Endpoint::parse(doc[key].get<std::string>());
    } catch (const std::invalid_argument &e) {
        throw ConfigError(std::string("'") + key + "': " + e.what());
    }
}

std::chrono::milliseconds millis_field(const nlohmann::json &doc, const char *key,
                                       std::chrono::milliseconds fallback, int64_t min_value) {
    if (!doc.contains(key)) {
        return fallback;
    }
    if (!doc[key].is_number_integer()) {
        throw ConfigError(std::string("'") + key + "' must be an integer");
    }
    const auto value = doc[key].get<int64_t>();
    if (value < min_value) {
        throw ConfigError(std::string("'") + key + "' must be >= " + std::to_string(min_value));
    }
    return std::chrono::milliseconds(value);
}

DiscoverOption options_field(const nlohmann::json &doc) {
    if (!doc.contains("discover")) {
        return DiscoverOption::All;
    }
    const auto &value = doc["discover"];
    if (value.is_string()) {
        const auto name = value.get<std::string>();
        if (name == "all") {
            return DiscoverOption::All;
        }
        if (name == "none") {
            return DiscoverOption::None;
        }
        return discover_option_from_name(name);
    }
    if (!value.is_array()) {
        throw ConfigError("'discover' must be \"all\", \"none\" or an array of option names");
    }
    DiscoverOption options = DiscoverOption::None;
    for (const auto &entry : value) {
        if (!entry.is_string()) {
            throw ConfigError("'discover' entries must be strings");
        }
        options = options | discover_option_from_name(entry.get<std::string>());
    }
    return options;
}

} // namespace

const char *discover_option_name(DiscoverOption option) {
    for (const auto &[flag, name] : kOptionNames) {
        if (flag == option) {
            return name;
        }
    }
    return "unknown";
}

DiscoverOption discover_option_from_name(std::string_view name) {
    for (const auto &[flag, option_name] : kOptionNames) {
        if (name == option_name) {
            return flag;
        }
    }
    throw ConfigError("unknown discover option '" + std::string(name) + "'");
}

ClientConfig parse_client_config(const nlohmann::json &doc) {
    if (!doc.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    ClientConfig config;
    config.bind = endpoint_field(doc, "bind", config.bind);
    config.broadcast = endpoint_field(doc, "broadcast", config.broadcast);

    if (doc.contains("source")) {
        if (!doc["source"].is_number_unsigned() || doc["source"].get<uint64_t>() > 0xFFFFFFFFu) {
            throw ConfigError("'source' must be an unsigned 32-bit integer");
        }
        config.source = doc["source"].get<uint32_t>();
    }

    config.read_timeout = millis_field(doc, "read_timeout_ms", config.read_timeout, 1);
    config.write_timeout = millis_field(doc, "write_timeout_ms", config.write_timeout, 1);
    config.discover_interval =
        millis_field(doc, "discover_interval_ms", config.discover_interval, 1);
    config.request_delay = millis_field(doc, "request_delay_ms", config.request_delay, 0);
    config.discover_options = options_field(doc);

    if (doc.contains("log_traffic")) {
        if (!doc["log_traffic"].is_boolean()) {
            throw ConfigError("'log_traffic' must be a boolean");
        }
        config.log_traffic = doc["log_traffic"].get<bool>();
    }

    return config;
}

ClientConfig load_client_config(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config file '" + path + "'");
    }
    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        throw ConfigError("config file '" + path + "' is not valid JSON");
    }
    return parse_client_config(doc);
}

nlohmann::json to_json(const ClientConfig &config) {
    nlohmann::json options = nlohmann::json::array();
    for (const auto &[flag, name] : kOptionNames) {
        if (has_option(config.discover_options, flag)) {
            options.push_back(name);
        }
    }
    return {
        {"bind", config.bind.to_string()},
        {"broadcast", config.broadcast.to_string()},
        {"source", config.source},
        {"read_timeout_ms", config.read_timeout.count()},
        {"write_timeout_ms", config.write_timeout.count()},
        {"discover_interval_ms", config.discover_interval.count()},
        {"request_delay_ms", config.request_delay.count()},
        {"discover", options},
        {"log_traffic", config.log_traffic},
    };
}

} // namespace lumen::client
