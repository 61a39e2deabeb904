// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"
#include "dht_fakes.h"

#include "crypto/ed25519.h"
#include "dns/packet.h"
#include "pkarr/bep44.h"
#include "pkarr/cache.h"
#include "pkarr/client.h"
#include "pkarr/signed_packet.h"

#include <cstdint>
#include <string>

namespace {

pkarr::SignedPacket packet_with_seq(const crypto::Keypair& kp, uint64_t seq) {
    dns::Packet p = dns::Packet::new_reply(0);
    p.answers.push_back(dns::ResourceRecord::a("_ip", {192, 0, 2, 1}, 60));
    return pkarr::SignedPacket::from_packet(kp, p, seq).value();
}

struct ClientFixture {
    int64_t        now = 5000;
    test::FakeRpc  rpc;
    pkarr::Cache   cache{16, [this] { return now; }};
    pkarr::Client  client{rpc, cache, pkarr::Client::Options{}};
};

} // namespace

// ============================================================================
// publish
// ============================================================================

TEST_CASE(Client, publish_puts_and_caches) {
    ClientFixture f;
    auto kp = crypto::Keypair::generate();
    auto sp = packet_with_seq(kp, 12);

    CHECK_OK(f.client.publish(sp));

    auto puts = f.rpc.puts();
    CHECK_EQ(puts.size(), size_t{1});
    CHECK(puts[0].target == sp.target());
    CHECK_EQ(puts[0].seq, uint64_t{12});
    CHECK(puts[0].v == sp.payload());
    CHECK(puts[0].k == kp.public_key().bytes());
    CHECK(!puts[0].salt.has_value());

    auto cached = f.cache.get(kp.public_key());
    CHECK(cached != nullptr);
    if (cached) CHECK(cached->packet == sp);
}

TEST_CASE(Client, publish_reports_engine_failure) {
    ClientFixture f;
    f.rpc.fail_puts(core::ErrorCode::NETWORK_TIMEOUT);
    auto kp = crypto::Keypair::generate();

    CHECK_ERR_CODE(f.client.publish(packet_with_seq(kp, 1)),
                   core::ErrorCode::NETWORK_TIMEOUT);
    // The local copy survives the failed put.
    CHECK(f.cache.get(kp.public_key()) != nullptr);
}

TEST_CASE(Client, publish_older_still_puts) {
    ClientFixture f;
    auto kp = crypto::Keypair::generate();
    CHECK_OK(f.client.publish(packet_with_seq(kp, 20)));
    CHECK_OK(f.client.publish(packet_with_seq(kp, 10)));

    CHECK_EQ(f.rpc.puts().size(), size_t{2});
    CHECK_EQ(f.cache.get(kp.public_key())->packet.sequence(), uint64_t{20});
}

// ============================================================================
// resolve
// ============================================================================

TEST_CASE(Client, fresh_cache_skips_lookup) {
    ClientFixture f;
    auto kp = crypto::Keypair::generate();
    auto sp = packet_with_seq(kp, 3);
    f.cache.put(sp);

    auto r = f.client.resolve(kp.public_key());
    CHECK_OK(r);
    CHECK(r.value().has_value());
    if (r.value()) CHECK(*r.value() == sp);
    CHECK_EQ(f.rpc.lookup_count(), size_t{0});
}

TEST_CASE(Client, lookup_populates_cache) {
    ClientFixture f;
    auto kp = crypto::Keypair::generate();
    f.rpc.serve(packet_with_seq(kp, 7));
    f.rpc.serve(packet_with_seq(kp, 9));
    f.rpc.serve(packet_with_seq(kp, 8));

    auto r = f.client.resolve(kp.public_key());
    CHECK_OK(r);
    CHECK(r.value().has_value());
    if (r.value()) CHECK_EQ(r.value()->sequence(), uint64_t{9});
    CHECK_EQ(f.rpc.lookup_count(), size_t{1});

    auto req = f.rpc.last_request();
    CHECK(req.has_value());
    if (req) CHECK(!req->seq.has_value());

    CHECK_EQ(f.cache.get(kp.public_key())->packet.sequence(), uint64_t{9});

    // Now fresh in cache.
    auto again = f.client.resolve(kp.public_key());
    CHECK_OK(again);
    CHECK_EQ(f.rpc.lookup_count(), size_t{1});
}

TEST_CASE(Client, stale_entry_sends_cached_seq) {
    ClientFixture f;
    auto kp = crypto::Keypair::generate();
    f.cache.put(packet_with_seq(kp, 4));
    f.now += 61;
    f.rpc.serve(packet_with_seq(kp, 5));

    auto r = f.client.resolve(kp.public_key());
    CHECK_OK(r);
    if (r.ok() && r.value()) CHECK_EQ(r.value()->sequence(), uint64_t{5});

    auto req = f.rpc.last_request();
    CHECK(req.has_value());
    if (req) {
        CHECK(req->seq.has_value());
        if (req->seq) CHECK_EQ(*req->seq, uint64_t{4});
    }
}

TEST_CASE(Client, failed_lookup_falls_back_to_stale) {
    ClientFixture f;
    auto kp = crypto::Keypair::generate();
    auto sp = packet_with_seq(kp, 4);
    f.cache.put(sp);
    f.now += 3600;
    f.rpc.fail_lookups(core::ErrorCode::NETWORK_TIMEOUT);

    auto r = f.client.resolve(kp.public_key());
    CHECK_OK(r);
    CHECK(r.value().has_value());
    if (r.value()) CHECK(*r.value() == sp);
}

TEST_CASE(Client, not_found_is_empty) {
    ClientFixture f;
    f.rpc.fail_lookups(core::ErrorCode::NETWORK_NOT_FOUND);
    auto kp = crypto::Keypair::generate();

    auto r = f.client.resolve(kp.public_key());
    CHECK_OK(r);
    CHECK(!r.value().has_value());
}

TEST_CASE(Client, empty_lookup_is_empty) {
    ClientFixture f;
    auto kp = crypto::Keypair::generate();

    auto r = f.client.resolve(kp.public_key());
    CHECK_OK(r);
    CHECK(!r.value().has_value());
    CHECK_EQ(f.rpc.lookup_count(), size_t{1});
}

TEST_CASE(Client, lookup_error_without_cache) {
    ClientFixture f;
    f.rpc.fail_lookups(core::ErrorCode::NETWORK_LOOKUP_FAILED);
    auto kp = crypto::Keypair::generate();

    CHECK_ERR_CODE(f.client.resolve(kp.public_key()),
                   core::ErrorCode::NETWORK_LOOKUP_FAILED);
}

TEST_CASE(Client, ignores_foreign_and_forged_values) {
    ClientFixture f;
    auto kp = crypto::Keypair::generate();
    auto other = crypto::Keypair::generate();
    const dht::Id target = pkarr::target_for(kp.public_key());

    f.rpc.serve_raw(target, test::FakeRpc::to_value(packet_with_seq(other, 50)));
    auto forged = test::FakeRpc::to_value(packet_with_seq(kp, 2));
    forged.seq = 99;
    f.rpc.serve_raw(target, forged);

    auto r = f.client.resolve(kp.public_key());
    CHECK_OK(r);
    CHECK(!r.value().has_value());
    CHECK(f.cache.get(other.public_key()) == nullptr);
    CHECK_EQ(f.cache.size(), size_t{0});
}

TEST_CASE(Client, passes_configured_resolvers) {
    test::FakeRpc rpc;
    pkarr::Cache cache(4, [] { return int64_t{0}; });
    pkarr::Client::Options opts;
    opts.resolvers = std::vector<net::SocketAddress>{
        net::SocketAddress::from_string("[2001:db8::1]:6881").value()};
    pkarr::Client client(rpc, cache, opts);

    auto kp = crypto::Keypair::generate();
    auto r = client.resolve(kp.public_key());
    CHECK_OK(r);

    auto resolvers = rpc.last_resolvers();
    CHECK(resolvers.has_value());
    if (resolvers) {
        CHECK_EQ(resolvers->size(), size_t{1});
        CHECK(resolvers->front().addr.is_ipv6());
        CHECK_EQ(resolvers->front().port, uint16_t{6881});
    }
}
