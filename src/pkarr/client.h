#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Client -- publish and resolve signed packets through a DHT engine.
// ---------------------------------------------------------------------------
// Unlike the passive resolver, the client runs lookups on the caller's
// thread and returns errors to the caller.  Results go through the shared
// cache, so a client and a resolver wired to the same Cache see each
// other's packets.
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "crypto/ed25519.h"
#include "dht/rpc.h"
#include "net/address.h"
#include "pkarr/cache.h"
#include "pkarr/signed_packet.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace pkarr {

class Client {
public:
    struct Options {
        uint32_t minimum_ttl = DEFAULT_MINIMUM_TTL;
        uint32_t maximum_ttl = DEFAULT_MAXIMUM_TTL;
        /// Query only these nodes instead of traversing the DHT.
        std::optional<std::vector<net::SocketAddress>> resolvers;
    };

    Client(dht::Rpc& rpc, Cache& cache, Options options);

    /// Store @p packet locally and put it on the DHT.  Engine failures are
    /// returned; the local copy is kept either way.
    [[nodiscard]] core::Result<void> publish(const SignedPacket& packet);

    /// Most recent packet for @p public_key.
    ///
    /// A fresh cached packet is returned without network traffic.
    /// Otherwise the DHT is queried; every verified answer goes into the
    /// cache and the newest known packet is returned.  If the lookup fails
    /// a stale cached packet is still returned; with nothing cached the
    /// error is.  std::nullopt means nobody has published under the key.
    [[nodiscard]] core::Result<std::optional<SignedPacket>> resolve(
        const crypto::PublicKey& public_key);

private:
    dht::Rpc&     rpc_;
    Cache&        cache_;
    const Options options_;
};

}  // namespace pkarr
