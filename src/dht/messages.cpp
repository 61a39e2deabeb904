// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "dht/messages.h"

namespace dht {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

const char* request_kind_name(const RequestKind& kind) noexcept {
    return std::visit(overloaded{
        [](const PingRequest&)         { return "ping"; },
        [](const FindNodeRequest&)     { return "find_node"; },
        [](const GetPeersRequest&)     { return "get_peers"; },
        [](const AnnouncePeerRequest&) { return "announce_peer"; },
        [](const GetValueRequest&)     { return "get"; },
        [](const PutMutableRequest&)   { return "put_mutable"; },
        [](const PutImmutableRequest&) { return "put_immutable"; },
    }, kind);
}

}  // namespace dht
