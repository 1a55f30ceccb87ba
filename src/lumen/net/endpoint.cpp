#include "lumen/net/endpoint.hpp"

#include <arpa/inet.h>

#include <charconv>
#include <stdexcept>

namespace lumen::net {

Endpoint Endpoint::parse(std::string_view text) {
    std::string host(text);
    uint16_t port = kLifxPort;

    const auto colon = text.rfind(':');
    if (colon != std::string_view::npos) {
        host = std::string(text.substr(0, colon));
        const auto port_text = text.substr(colon + 1);
        unsigned value = 0;
        const auto [ptr, ec] =
            std::from_chars(port_text.data(), port_text.data() + port_text.size(), value);
        if (ec != std::errc{} || ptr != port_text.data() + port_text.size() || value > 65535) {
            throw std::invalid_argument("invalid port in endpoint '" + std::string(text) + "'");
        }
        port = static_cast<uint16_t>(value);
    }

    in_addr addr{};
    if (inet_pton(AF_INET, host.c_str(), &addr) != 1) {
        throw std::invalid_argument("invalid IPv4 address in endpoint '" + std::string(text) +
                                    "'");
    }
    return {ntohl(addr.s_addr), port};
}

Endpoint Endpoint::broadcast() { return {0xFFFFFFFFu, kLifxPort}; }

std::string Endpoint::address_string() const {
    in_addr addr{};
    addr.s_addr = htonl(address);
    char buffer[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &addr, buffer, sizeof(buffer));
    return buffer;
}

std::string Endpoint::to_string() const { return address_string() + ":" + std::to_string(port); }

} // namespace lumen::net
