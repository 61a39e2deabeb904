#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Seams to the DHT engine.
//
// The engine owns the routing table and the UDP socket.  It hands every
// inbound query to a RequestHandler together with itself, and exposes
// blocking lookup primitives used by the refresh workers and the client.
// Timeouts are the engine's concern: a lookup that times out simply
// returns NETWORK_TIMEOUT.
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "dht/messages.h"
#include "net/address.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace dht {

class Rpc {
public:
    virtual ~Rpc() = default;

    /// This node's id.
    [[nodiscard]] virtual const Id& id() const = 0;

    /// Send a response to an inbound query.
    virtual void respond(const net::SocketAddress& to,
                         uint16_t transaction_id,
                         Response response) = 0;

    /// Traverse the DHT towards @p target issuing @p request, or query
    /// only @p resolvers when given.  Returns every mutable value
    /// received (possibly none).  Must be safe to call from any thread.
    [[nodiscard]] virtual core::Result<std::vector<MutableValue>> get_mutable(
        const Id& target,
        const GetValueRequest& request,
        const std::optional<std::vector<net::SocketAddress>>& resolvers) = 0;

    /// Store a mutable item on the nodes closest to its target.
    [[nodiscard]] virtual core::Result<void> put_mutable(
        const PutMutableRequest& request) = 0;
};

class RequestHandler {
public:
    virtual ~RequestHandler() = default;

    virtual void handle_request(Rpc& rpc,
                                const net::SocketAddress& from,
                                uint16_t transaction_id,
                                const Request& request) = 0;
};

}  // namespace dht
