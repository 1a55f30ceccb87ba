#include "lumen/data/device_directory.hpp"

#include <cstdio>
#include <mutex>

namespace lumen::data {

namespace {

template <typename T> bool assign_if_changed(std::optional<T> &field, const T &value) {
    if (field.has_value() && *field == value) {
        return false;
    }
    field = value;
    return true;
}

} // namespace

std::string format_target(uint64_t target) {
    // Targets are little-endian on the wire, so the MAC's first octet is the low byte.
    char buffer[13];
    std::snprintf(buffer, sizeof(buffer), "%02x%02x%02x%02x%02x%02x",
                  static_cast<unsigned>(target & 0xff), static_cast<unsigned>((target >> 8) & 0xff),
                  static_cast<unsigned>((target >> 16) & 0xff),
                  static_cast<unsigned>((target >> 24) & 0xff),
                  static_cast<unsigned>((target >> 32) & 0xff),
                  static_cast<unsigned>((target >> 40) & 0xff));
    return buffer;
}

std::string Bulb::to_string() const {
    std::string out = label.value_or("<unnamed>");
    out += " (" + format_target(target) + ") " + endpoint.to_string();
    if (location.has_value()) {
        out += " @" + *location;
    }
    return out;
}

void to_json(nlohmann::json &j, const Bulb &bulb) {
    j = nlohmann::json{
        {"target", format_target(bulb.target)},
        {"address", bulb.endpoint.address_string()},
        {"port", bulb.endpoint.port},
    };
    j["label"] = bulb.label.has_value() ? nlohmann::json(*bulb.label) : nlohmann::json(nullptr);
    j["location"] =
        bulb.location.has_value() ? nlohmann::json(*bulb.location) : nlohmann::json(nullptr);
    j["group"] = bulb.group.has_value() ? nlohmann::json(*bulb.group) : nlohmann::json(nullptr);
    if (bulb.power.has_value()) {
        j["power"] = *bulb.power == protocol::Power::Max;
    } else {
        j["power"] = nullptr;
    }
    if (bulb.color.has_value()) {
        j["color"] = {
            {"hue", bulb.color->hue()},
            {"saturation", bulb.color->saturation()},
            {"brightness", bulb.color->brightness()},
            {"kelvin", bulb.color->kelvin()},
        };
    } else {
        j["color"] = nullptr;
    }
}

bool DeviceDirectory::apply(const protocol::Message &message, const net::Endpoint &from) {
    namespace device = protocol::device;
    namespace light = protocol::light;

    const auto &payload = message.payload();
    const uint64_t target = message.target();

    if (const auto *service = payload.get_if<device::StateService>()) {
        return register_device(target, *service, from);
    }

    std::unique_lock lock(mutex_);
    auto it = devices_.find(target);
    if (it == devices_.end()) {
        // Reply raced ahead of this device's StateService.
        return false;
    }
    Bulb &bulb = it->second;

    if (const auto *m = payload.get_if<device::StateLabel>()) {
        return assign_if_changed(bulb.label, m->label);
    }
    if (const auto *m = payload.get_if<device::StateLocation>()) {
        return assign_if_changed(bulb.location, m->label);
    }
    if (const auto *m = payload.get_if<device::StateGroup>()) {
        return assign_if_changed(bulb.group, m->label);
    }
    if (const auto *m = payload.get_if<device::StatePower>()) {
        return assign_if_changed(bulb.power, m->level);
    }
    if (const auto *m = payload.get_if<light::StatePower>()) {
        return assign_if_changed(bulb.power, m->level);
    }
    if (const auto *m = payload.get_if<light::State>()) {
        bool changed = assign_if_changed(bulb.power, m->power);
        changed = assign_if_changed(bulb.color, m->color) || changed;
        changed = assign_if_changed(bulb.label, m->label) || changed;
        return changed;
    }
    return false;
}

bool DeviceDirectory::register_device(uint64_t target,
                                      const protocol::device::StateService &service,
                                      const net::Endpoint &from) {
    if (service.service != protocol::Service::Udp || service.port > 65535) {
        return false;
    }

    std::unique_lock lock(mutex_);
    if (devices_.contains(target)) {
        return false;
    }
    Bulb bulb;
    bulb.target = target;
    bulb.endpoint = from.with_port(static_cast<uint16_t>(service.port));
    devices_.emplace(target, std::move(bulb));
    return true;
}

DeviceMap DeviceDirectory::snapshot() const {
    std::shared_lock lock(mutex_);
    return devices_;
}

std::optional<Bulb> DeviceDirectory::find(uint64_t target) const {
    std::shared_lock lock(mutex_);
    auto it = devices_.find(target);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t DeviceDirectory::size() const {
    std::shared_lock lock(mutex_);
    return devices_.size();
}

} // namespace lumen::data
