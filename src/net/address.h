#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// NetAddress / SocketAddress -- IP endpoints of DHT peers.
//
// NetAddress keys the per-source rate limiter; SocketAddress identifies the
// sender of an inbound request and the explicit resolvers a lookup may be
// directed at.
// ---------------------------------------------------------------------------

#include "core/error.h"

#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace net {

enum class Network : uint8_t {
    IPV4 = 1,
    IPV6 = 2,
};

// ---------------------------------------------------------------------------
// NetAddress
// ---------------------------------------------------------------------------
class NetAddress {
public:
    /// Default: 0.0.0.0.
    NetAddress() noexcept = default;

    /// Create an IPv4 address from a host-order 32-bit integer.
    static NetAddress from_ipv4(uint32_t ip) noexcept;

    /// Create an IPv6 address from a 16-byte network-order span.
    /// IPv4-mapped addresses (::ffff:a.b.c.d) are folded to IPv4 so one
    /// host cannot appear under two keys.
    static NetAddress from_ipv6(std::span<const uint8_t, 16> ip) noexcept;

    /// Parse "1.2.3.4", "::1" or "[::1]".
    static core::Result<NetAddress> from_string(std::string_view str);

    [[nodiscard]] bool is_ipv4() const noexcept { return network_ == Network::IPV4; }
    [[nodiscard]] bool is_ipv6() const noexcept { return network_ == Network::IPV6; }

    [[nodiscard]] Network network() const noexcept { return network_; }

    /// 4 bytes for IPv4, 16 for IPv6.
    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept;

    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const NetAddress&) const = default;
    bool operator==(const NetAddress&) const = default;

private:
    Network                 network_    = Network::IPV4;
    std::array<uint8_t, 16> addr_bytes_ = {};
};

// ---------------------------------------------------------------------------
// SocketAddress
// ---------------------------------------------------------------------------
struct SocketAddress {
    NetAddress addr;
    uint16_t   port = 0;

    /// Parse "1.2.3.4:6881" or "[::1]:6881".  The port is mandatory.
    static core::Result<SocketAddress> from_string(std::string_view str);

    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const SocketAddress&) const = default;
    bool operator==(const SocketAddress&) const = default;
};

/// Resolve "host:port" where host is a literal address or a DNS name.
/// Every returned address carries the given port.  Fails with
/// NETWORK_LOOKUP_FAILED if the name does not resolve.
core::Result<std::vector<SocketAddress>> resolve_socket_addresses(
    std::string_view host_port);

}  // namespace net

template <>
struct std::hash<net::NetAddress> {
    std::size_t operator()(const net::NetAddress& addr) const noexcept;
};

template <>
struct std::hash<net::SocketAddress> {
    std::size_t operator()(const net::SocketAddress& sa) const noexcept;
};
