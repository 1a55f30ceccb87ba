#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace lumen::net {

inline constexpr uint16_t kLifxPort = 56700;

/// IPv4 address and port, both in host byte order.
struct Endpoint {
    uint32_t address = 0;
    uint16_t port = 0;

    /// Parses "a.b.c.d:port" (or "a.b.c.d", which takes kLifxPort).
    /// Throws std::invalid_argument.
    static Endpoint parse(std::string_view text);

    /// 255.255.255.255:56700
    static Endpoint broadcast();

    [[nodiscard]] Endpoint with_port(uint16_t new_port) const { return {address, new_port}; }
    [[nodiscard]] std::string address_string() const;
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Endpoint &) const = default;
};

} // namespace lumen::net
