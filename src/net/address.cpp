// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "net/address.h"
#include "core/logging.h"

#include <charconv>
#include <cstring>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace net {

// ===================================================================
// Internal helpers
// ===================================================================

namespace {

/// Parse a dotted-quad IPv4 string into a host-order uint32_t.
bool parse_ipv4(std::string_view str, uint32_t& out) {
    uint32_t result = 0;
    int octet_count = 0;

    size_t pos = 0;
    while (pos <= str.size() && octet_count < 4) {
        size_t dot = str.find('.', pos);
        if (dot == std::string_view::npos) {
            dot = str.size();
        }

        std::string_view part = str.substr(pos, dot - pos);
        if (part.empty() || part.size() > 3) {
            return false;
        }
        // Reject leading zeros (e.g. "01.02.03.04").
        if (part.size() > 1 && part[0] == '0') {
            return false;
        }

        uint32_t val = 0;
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), val);
        if (ec != std::errc{} || ptr != part.data() + part.size() || val > 255) {
            return false;
        }

        result = (result << 8) | val;
        ++octet_count;
        pos = dot + 1;
    }

    if (octet_count != 4 || pos - 1 != str.size()) {
        return false;
    }
    out = result;
    return true;
}

int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

/// Parse an IPv6 address string into 16 bytes (network order).
/// Supports "::" shorthand but not zone ids or embedded IPv4.
bool parse_ipv6(std::string_view str, uint8_t out[16]) {
    std::memset(out, 0, 16);

    if (str.size() >= 2 && str.front() == '[' && str.back() == ']') {
        str = str.substr(1, str.size() - 2);
    }
    if (str.empty()) {
        return false;
    }

    uint16_t left[8] = {};
    uint16_t right[8] = {};
    int left_count = 0;
    int right_count = 0;

    auto dc_pos = str.find("::");
    const bool has_double_colon = dc_pos != std::string_view::npos;
    std::string_view left_part = has_double_colon ? str.substr(0, dc_pos) : str;
    std::string_view right_part =
        has_double_colon ? str.substr(dc_pos + 2) : std::string_view{};

    auto parse_groups = [](std::string_view s, uint16_t* groups, int& count) -> bool {
        count = 0;
        if (s.empty()) return true;

        size_t pos = 0;
        while (pos <= s.size() && count < 8) {
            size_t colon = s.find(':', pos);
            if (colon == std::string_view::npos) colon = s.size();
            std::string_view group = s.substr(pos, colon - pos);
            if (group.empty() || group.size() > 4) return false;

            uint16_t val = 0;
            for (char c : group) {
                int n = hex_nibble(c);
                if (n < 0) return false;
                val = static_cast<uint16_t>((val << 4) | n);
            }
            groups[count++] = val;
            pos = colon + 1;
        }
        return pos - 1 == s.size();
    };

    if (!parse_groups(left_part, left, left_count)) return false;
    if (has_double_colon && !parse_groups(right_part, right, right_count)) {
        return false;
    }

    const int total = left_count + right_count;
    if (has_double_colon ? total > 7 : total != 8) return false;

    for (int i = 0; i < left_count; ++i) {
        out[i * 2]     = static_cast<uint8_t>(left[i] >> 8);
        out[i * 2 + 1] = static_cast<uint8_t>(left[i] & 0xFF);
    }
    const int right_start = 8 - right_count;
    for (int i = 0; i < right_count; ++i) {
        const int idx = right_start + i;
        out[idx * 2]     = static_cast<uint8_t>(right[i] >> 8);
        out[idx * 2 + 1] = static_cast<uint8_t>(right[i] & 0xFF);
    }
    return true;
}

bool is_ipv4_mapped(const uint8_t bytes[16]) {
    static constexpr uint8_t prefix[12] = {
        0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xFF, 0xFF
    };
    return std::memcmp(bytes, prefix, 12) == 0;
}

/// Split "host:port" / "[v6]:port" into its two halves.
core::Result<std::pair<std::string_view, uint16_t>> split_host_port(
    std::string_view str) {
    std::string_view host;
    std::string_view port_str;

    if (!str.empty() && str.front() == '[') {
        auto close = str.find(']');
        if (close == std::string_view::npos) {
            return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                "missing closing bracket in IPv6 address");
        }
        host = str.substr(1, close - 1);
        auto rest = str.substr(close + 1);
        if (rest.empty() || rest.front() != ':') {
            return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                "expected ':<port>' after ']' in '" + std::string(str) + "'");
        }
        port_str = rest.substr(1);
    } else {
        auto colon = str.rfind(':');
        if (colon == std::string_view::npos ||
            str.find(':') != colon) {
            return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                "expected host:port, got '" + std::string(str) + "'");
        }
        host = str.substr(0, colon);
        port_str = str.substr(colon + 1);
    }

    if (host.empty() || port_str.empty()) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
            "expected host:port, got '" + std::string(str) + "'");
    }

    uint32_t parsed = 0;
    auto [ptr, ec] = std::from_chars(
        port_str.data(), port_str.data() + port_str.size(), parsed);
    if (ec != std::errc{} || ptr != port_str.data() + port_str.size()) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
            "invalid port: " + std::string(port_str));
    }
    if (parsed == 0 || parsed > 65535) {
        return core::make_error(core::ErrorCode::VALIDATION_RANGE,
            "port out of range: " + std::string(port_str));
    }
    return std::make_pair(host, static_cast<uint16_t>(parsed));
}

}  // anonymous namespace

// ===================================================================
// NetAddress
// ===================================================================

NetAddress NetAddress::from_ipv4(uint32_t ip) noexcept {
    NetAddress addr;
    addr.network_ = Network::IPV4;
    addr.addr_bytes_[0] = static_cast<uint8_t>(ip >> 24);
    addr.addr_bytes_[1] = static_cast<uint8_t>(ip >> 16);
    addr.addr_bytes_[2] = static_cast<uint8_t>(ip >> 8);
    addr.addr_bytes_[3] = static_cast<uint8_t>(ip);
    return addr;
}

NetAddress NetAddress::from_ipv6(std::span<const uint8_t, 16> ip) noexcept {
    if (is_ipv4_mapped(ip.data())) {
        return from_ipv4((static_cast<uint32_t>(ip[12]) << 24) |
                         (static_cast<uint32_t>(ip[13]) << 16) |
                         (static_cast<uint32_t>(ip[14]) << 8) |
                         static_cast<uint32_t>(ip[15]));
    }
    NetAddress addr;
    addr.network_ = Network::IPV6;
    std::memcpy(addr.addr_bytes_.data(), ip.data(), 16);
    return addr;
}

core::Result<NetAddress> NetAddress::from_string(std::string_view str) {
    uint32_t v4 = 0;
    if (parse_ipv4(str, v4)) {
        return from_ipv4(v4);
    }
    uint8_t v6[16];
    if (parse_ipv6(str, v6)) {
        return from_ipv6(std::span<const uint8_t, 16>(v6, 16));
    }
    return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
        "not an IP address: '" + std::string(str) + "'");
}

std::span<const uint8_t> NetAddress::bytes() const noexcept {
    return std::span<const uint8_t>(addr_bytes_.data(), is_ipv4() ? 4 : 16);
}

std::string NetAddress::to_string() const {
    if (is_ipv4()) {
        return std::to_string(addr_bytes_[0]) + "." +
               std::to_string(addr_bytes_[1]) + "." +
               std::to_string(addr_bytes_[2]) + "." +
               std::to_string(addr_bytes_[3]);
    }

    uint16_t groups[8];
    for (int i = 0; i < 8; ++i) {
        groups[i] = static_cast<uint16_t>(
            (static_cast<uint16_t>(addr_bytes_[i * 2]) << 8)
            | addr_bytes_[i * 2 + 1]);
    }

    // Longest run of zero groups becomes "::".
    int best_start = -1, best_len = 0;
    int cur_start = -1, cur_len = 0;
    for (int i = 0; i < 8; ++i) {
        if (groups[i] == 0) {
            if (cur_start < 0) cur_start = i;
            ++cur_len;
            if (cur_len > best_len) {
                best_start = cur_start;
                best_len = cur_len;
            }
        } else {
            cur_start = -1;
            cur_len = 0;
        }
    }
    if (best_len < 2) best_start = -1;

    std::string result;
    for (int i = 0; i < 8; ++i) {
        if (i == best_start) {
            result += "::";
            i += best_len - 1;
            continue;
        }
        if (!result.empty() && result.back() != ':') {
            result += ':';
        }
        char buf[8];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), groups[i], 16);
        result.append(buf, ptr);
    }
    return result;
}

// ===================================================================
// SocketAddress
// ===================================================================

core::Result<SocketAddress> SocketAddress::from_string(std::string_view str) {
    PKARR_TRY_ASSIGN(parts, split_host_port(str));
    PKARR_TRY_ASSIGN(addr, NetAddress::from_string(parts.first));
    return SocketAddress{addr, parts.second};
}

std::string SocketAddress::to_string() const {
    if (addr.is_ipv6()) {
        return "[" + addr.to_string() + "]:" + std::to_string(port);
    }
    return addr.to_string() + ":" + std::to_string(port);
}

core::Result<std::vector<SocketAddress>> resolve_socket_addresses(
    std::string_view host_port) {
    PKARR_TRY_ASSIGN(parts, split_host_port(host_port));
    const auto [host_view, port] = parts;

    if (auto literal = NetAddress::from_string(host_view); literal.ok()) {
        return std::vector<SocketAddress>{SocketAddress{literal.value(), port}};
    }

    const std::string host{host_view};
    LOG_DEBUG(core::LogCategory::DHT, "Resolving resolver host " + host);

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;   // DHT traffic is UDP
    hints.ai_protocol = IPPROTO_UDP;

    struct addrinfo* result_list = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &result_list);
    if (rc != 0) {
        return core::make_error(core::ErrorCode::NETWORK_LOOKUP_FAILED,
            "cannot resolve " + host + ": " + std::string(gai_strerror(rc)));
    }

    std::vector<SocketAddress> results;
    for (struct addrinfo* rp = result_list; rp != nullptr; rp = rp->ai_next) {
        if (rp->ai_family == AF_INET) {
            auto* sin = reinterpret_cast<struct sockaddr_in*>(rp->ai_addr);
            results.push_back(SocketAddress{
                NetAddress::from_ipv4(ntohl(sin->sin_addr.s_addr)), port});
        } else if (rp->ai_family == AF_INET6) {
            auto* sin6 = reinterpret_cast<struct sockaddr_in6*>(rp->ai_addr);
            results.push_back(SocketAddress{
                NetAddress::from_ipv6(std::span<const uint8_t, 16>(
                    sin6->sin6_addr.s6_addr, 16)),
                port});
        }
    }
    freeaddrinfo(result_list);

    if (results.empty()) {
        return core::make_error(core::ErrorCode::NETWORK_LOOKUP_FAILED,
            "no IPv4/IPv6 address for " + host);
    }
    return results;
}

}  // namespace net

std::size_t std::hash<net::NetAddress>::operator()(
    const net::NetAddress& addr) const noexcept {
    // FNV-1a over the network byte + address bytes.
    std::size_t h = 14695981039346656037ULL;
    h ^= static_cast<std::size_t>(addr.network());
    h *= 1099511628211ULL;
    for (auto b : addr.bytes()) {
        h ^= static_cast<std::size_t>(b);
        h *= 1099511628211ULL;
    }
    return h;
}

std::size_t std::hash<net::SocketAddress>::operator()(
    const net::SocketAddress& sa) const noexcept {
    std::size_t h = std::hash<net::NetAddress>{}(sa.addr);
    h ^= std::hash<uint16_t>{}(sa.port) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}
