#include "lumen/net/udp_socket.hpp"

#include "lumen/error.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace lumen::net {

namespace {

std::string errno_text(const char *what) {
    return std::string(what) + ": " + std::strerror(errno);
}

sockaddr_in to_sockaddr(const Endpoint &ep) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(ep.address);
    addr.sin_port = htons(ep.port);
    return addr;
}

timeval to_timeval(std::chrono::milliseconds ms) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
    return tv;
}

} // namespace

std::unique_ptr<UdpSocket> UdpSocket::bind(const Endpoint &local,
                                           std::chrono::milliseconds read_timeout,
                                           std::chrono::milliseconds write_timeout) {
    const int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        throw BindError(errno_text("socket"));
    }
    // Owns fd from here on, including on the error paths below.
    auto sock = std::make_unique<UdpSocket>(Passkey{}, fd);

    const int reuse = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0) {
        throw BindError(errno_text("setsockopt(SO_REUSEADDR)"));
    }

    const timeval rcv = to_timeval(read_timeout);
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &rcv, sizeof(rcv)) != 0) {
        throw BindError(errno_text("setsockopt(SO_RCVTIMEO)"));
    }
    const timeval snd = to_timeval(write_timeout);
    if (::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &snd, sizeof(snd)) != 0) {
        throw BindError(errno_text("setsockopt(SO_SNDTIMEO)"));
    }

    const sockaddr_in addr = to_sockaddr(local);
    if (::bind(fd, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) != 0) {
        throw BindError(errno_text(("bind " + local.to_string()).c_str()));
    }

    return sock;
}

UdpSocket::~UdpSocket() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

size_t UdpSocket::send_to(std::span<const uint8_t> bytes, const Endpoint &to) {
    const sockaddr_in addr = to_sockaddr(to);
    const ssize_t sent = ::sendto(fd_, bytes.data(), bytes.size(), 0,
                                  reinterpret_cast<const sockaddr *>(&addr), sizeof(addr));
    if (sent < 0) {
        throw SocketError(errno_text(("sendto " + to.to_string()).c_str()));
    }
    return static_cast<size_t>(sent);
}

std::optional<Datagram> UdpSocket::recv_from(std::span<uint8_t> buffer) {
    sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    const ssize_t received = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                        reinterpret_cast<sockaddr *>(&from), &from_len);
    if (received < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return std::nullopt;
        }
        throw SocketError(errno_text("recvfrom"));
    }
    return Datagram{
        .size = static_cast<size_t>(received),
        .from = Endpoint{ntohl(from.sin_addr.s_addr), ntohs(from.sin_port)},
    };
}

void UdpSocket::set_broadcast(bool enabled) {
    const int value = enabled ? 1 : 0;
    if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &value, sizeof(value)) != 0) {
        throw SocketError(errno_text("setsockopt(SO_BROADCAST)"));
    }
    broadcast_.store(enabled, std::memory_order_relaxed);
}

Endpoint UdpSocket::local_endpoint() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
        throw SocketError(errno_text("getsockname"));
    }
    return {ntohl(addr.sin_addr.s_addr), ntohs(addr.sin_port)};
}

} // namespace lumen::net
