#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// KRPC message shapes exchanged with the Mainline DHT engine.
//
// Requests arrive as a closed tagged union over the BEP5 / BEP44 query
// kinds.  Only the fields a request handler needs are modelled; the
// bencoding itself belongs to the engine.
// ---------------------------------------------------------------------------

#include "core/types.h"
#include "net/address.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dht {

/// 160-bit node id / info hash / BEP44 target.
using Id = core::uint160;

using Token = std::vector<uint8_t>;

struct Node {
    Id                 id;
    net::SocketAddress address;

    bool operator==(const Node&) const = default;
};

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

struct PingRequest {};

struct FindNodeRequest {
    Id target;
};

struct GetPeersRequest {
    Id info_hash;
};

struct AnnouncePeerRequest {
    Id       info_hash;
    uint16_t port         = 0;
    bool     implied_port = false;
    Token    token;
};

/// BEP44 `get`.  When `seq` is set the responder may omit `v` if its
/// stored sequence is not newer.
struct GetValueRequest {
    Id                                  target;
    std::optional<uint64_t>             seq;
    std::optional<std::vector<uint8_t>> salt;
};

/// BEP44 `put` of a mutable item.
struct PutMutableRequest {
    Id                                  target;
    Token                               token;
    std::vector<uint8_t>                v;
    std::array<uint8_t, 32>             k{};
    uint64_t                            seq = 0;
    std::array<uint8_t, 64>             sig{};
    std::optional<std::vector<uint8_t>> salt;
    std::optional<uint64_t>             cas;
};

/// BEP44 `put` of an immutable item.
struct PutImmutableRequest {
    Id                   target;
    Token                token;
    std::vector<uint8_t> v;
};

using RequestKind = std::variant<PingRequest,
                                 FindNodeRequest,
                                 GetPeersRequest,
                                 AnnouncePeerRequest,
                                 GetValueRequest,
                                 PutMutableRequest,
                                 PutImmutableRequest>;

struct Request {
    Id          requester_id;
    bool        read_only = false;
    RequestKind kind;
};

/// Short name of a request kind for logs ("get", "put", ...).
[[nodiscard]] const char* request_kind_name(const RequestKind& kind) noexcept;

// ---------------------------------------------------------------------------
// Responses
// ---------------------------------------------------------------------------

struct PingResponse {
    Id responder_id;
};

struct FindNodeResponse {
    Id                responder_id;
    std::vector<Node> nodes;
};

/// Reply to a `get` for which no value is stored: a token for a later put
/// and the closest nodes known.
struct NoValuesResponse {
    Id                               responder_id;
    Token                            token;
    std::optional<std::vector<Node>> nodes;
};

/// Reply to a `get` carrying a signed mutable item.  Carries everything a
/// requester needs to re-verify the value on its own.
struct GetMutableResponse {
    Id                               responder_id;
    Token                            token;
    std::optional<std::vector<Node>> nodes;
    std::vector<uint8_t>             v;
    std::array<uint8_t, 32>          k{};
    uint64_t                         seq = 0;
    std::array<uint8_t, 64>          sig{};
};

struct ErrorResponse {
    int         code = 0;
    std::string description;
};

using Response = std::variant<PingResponse,
                              FindNodeResponse,
                              NoValuesResponse,
                              GetMutableResponse,
                              ErrorResponse>;

// ---------------------------------------------------------------------------
// Lookup results
// ---------------------------------------------------------------------------

/// One mutable item returned by a remote node during a `get` traversal.
/// Unverified: callers must check the signature before trusting it.
struct MutableValue {
    std::array<uint8_t, 32> k{};
    uint64_t                seq = 0;
    std::vector<uint8_t>    v;
    std::array<uint8_t, 64> sig{};
    net::SocketAddress      from;
};

}  // namespace dht
