// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pkarr/client.h"

#include "core/logging.h"
#include "pkarr/bep44.h"

#include <string>
#include <utility>

namespace pkarr {

Client::Client(dht::Rpc& rpc, Cache& cache, Options options)
    : rpc_(rpc), cache_(cache), options_(std::move(options)) {}

core::Result<void> Client::publish(const SignedPacket& packet) {
    const std::string key = packet.public_key().to_zbase32();

    PutOutcome outcome = cache_.put(packet);
    if (outcome == PutOutcome::IGNORED) {
        LOG_DEBUG(core::LogCategory::CLIENT,
                  "publishing " + key + " seq " +
                  std::to_string(packet.sequence()) +
                  " although a newer packet is cached");
    }

    auto put = rpc_.put_mutable(packet.item().to_put_request({}));
    if (!put.ok()) {
        LOG_WARN(core::LogCategory::CLIENT,
                 "publish of " + key + " failed: " + put.error().format());
        return put.error();
    }

    LOG_INFO(core::LogCategory::CLIENT,
             "published " + key + " seq " + std::to_string(packet.sequence()));
    return core::make_ok();
}

core::Result<std::optional<SignedPacket>> Client::resolve(
    const crypto::PublicKey& public_key) {
    const dht::Id target = target_for(public_key);
    const std::string key = public_key.to_zbase32();

    auto cached = cache_.get(target);
    if (cached &&
        cached->expires_in(options_.minimum_ttl, options_.maximum_ttl,
                           cache_.now()) > 0) {
        LOG_DEBUG(core::LogCategory::CLIENT, "resolved " + key + " from cache");
        return std::optional<SignedPacket>(cached->packet);
    }

    dht::GetValueRequest request{target, std::nullopt, std::nullopt};
    if (cached) {
        request.seq = cached->packet.sequence();
    }

    auto values = rpc_.get_mutable(target, request, options_.resolvers);
    if (!values.ok()) {
        const core::Error& err = values.error();
        if (cached) {
            LOG_WARN(core::LogCategory::CLIENT,
                     "lookup of " + key + " failed, using stale packet: " +
                     err.format());
            return std::optional<SignedPacket>(cached->packet);
        }
        if (err.code() == core::ErrorCode::NETWORK_NOT_FOUND) {
            return std::optional<SignedPacket>{};
        }
        return err;
    }

    for (const auto& value : values.value()) {
        auto packet = MutableItem::from_dht(value).and_then(
            [](MutableItem item) {
                return SignedPacket::from_item(std::move(item));
            });
        if (!packet.ok()) {
            LOG_DEBUG(core::LogCategory::CLIENT,
                      "invalid value for " + key + " from " +
                      value.from.to_string() + ": " +
                      packet.error().format());
            continue;
        }
        if (packet.value().public_key() != public_key) {
            LOG_DEBUG(core::LogCategory::CLIENT,
                      "value from " + value.from.to_string() +
                      " signed by another key");
            continue;
        }
        cache_.put(packet.value());
    }

    auto latest = cache_.get(target);
    if (!latest) {
        LOG_DEBUG(core::LogCategory::CLIENT, "nothing published under " + key);
        return std::optional<SignedPacket>{};
    }
    return std::optional<SignedPacket>(latest->packet);
}

}  // namespace pkarr
