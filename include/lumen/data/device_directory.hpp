#pragma once

#include "lumen/net/endpoint.hpp"
#include "lumen/protocol/message.hpp"
#include "lumen/protocol/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace lumen::data {

/// A discovered device.
/// Created by the first StateService seen for its target; the optional fields fill
/// in as further State replies arrive.
struct Bulb {
    uint64_t target = 0;
    net::Endpoint endpoint; // sender address, advertised service port
    std::optional<std::string> label;
    std::optional<std::string> location;
    std::optional<std::string> group;
    std::optional<protocol::Power> power;
    std::optional<protocol::HSBK> color;

    /// "Kitchen (d073d5000001) 192.168.1.20:56700"
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Bulb &) const = default;
};

/// Target id as the 12-digit hex MAC the devices print on their labels.
std::string format_target(uint64_t target);

void to_json(nlohmann::json &j, const Bulb &bulb);

using DeviceMap = std::unordered_map<uint64_t, Bulb>;

/// Directory of discovered devices keyed by target id.
/// Thread safety: one writer (the receive loop) and any number of readers. Readers
/// always get copies, never references into the map.
class DeviceDirectory {
  public:
    /// Folds one inbound message into the directory. Returns true if it changed.
    bool apply(const protocol::Message &message, const net::Endpoint &from);

    [[nodiscard]] DeviceMap snapshot() const;
    [[nodiscard]] std::optional<Bulb> find(uint64_t target) const;
    [[nodiscard]] size_t size() const;

  private:
    bool register_device(uint64_t target, const protocol::device::StateService &service,
                         const net::Endpoint &from);

    mutable std::shared_mutex mutex_;
    DeviceMap devices_;
};

} // namespace lumen::data
