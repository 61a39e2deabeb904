// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "server/refresh_pool.h"

#include "core/logging.h"
#include "core/thread.h"
#include "pkarr/bep44.h"
#include "pkarr/signed_packet.h"

#include <chrono>
#include <exception>
#include <string>

namespace server {

RefreshPool::RefreshPool(dht::Rpc& rpc, pkarr::Cache& cache, Options options)
    : rpc_(rpc),
      cache_(cache),
      options_(std::move(options)),
      queue_(options_.queue_capacity) {}

RefreshPool::~RefreshPool() {
    stop();
}

void RefreshPool::start() {
    if (running_.exchange(true)) return;

    size_t n = options_.num_threads == 0 ? 1 : options_.num_threads;
    for (size_t i = 0; i < n; ++i) {
        workers_.emplace_back(
            [this, i](std::stop_token st) {
                core::set_thread_name("refresh." + std::to_string(i));
                worker_loop(st);
            });
    }
    LOG_INFO(core::LogCategory::RESOLVER,
             "Refresh pool started with " + std::to_string(n) +
             " workers, queue capacity " +
             std::to_string(options_.queue_capacity));
}

void RefreshPool::stop() {
    if (!running_.exchange(false)) return;

    queue_.close();

    for (auto& t : workers_) {
        if (t.joinable()) {
            t.request_stop();
            t.join();
        }
    }
    workers_.clear();

    // Queued targets will never run.
    {
        std::lock_guard lock(in_flight_mutex_);
        in_flight_.clear();
    }
    idle_cv_.notify_all();
}

RefreshPool::Submit RefreshPool::submit(const dht::Id& target) {
    {
        std::lock_guard lock(in_flight_mutex_);
        if (!in_flight_.insert(target).second) {
            return Submit::COALESCED;
        }
    }

    if (!running_.load() || !queue_.try_send(target)) {
        LOG_WARN(core::LogCategory::RESOLVER,
                 std::string(running_.load() ? "Refresh queue full"
                                             : "Refresh pool stopped") +
                 ", dropping lookup for " + target.to_hex());
        finish(target);
        return Submit::DROPPED;
    }
    return Submit::QUEUED;
}

void RefreshPool::wait_idle() {
    std::unique_lock lock(in_flight_mutex_);
    idle_cv_.wait(lock, [this] { return in_flight_.empty(); });
}

size_t RefreshPool::pending() const {
    std::lock_guard lock(in_flight_mutex_);
    return in_flight_.size();
}

void RefreshPool::worker_loop(std::stop_token stoken) {
    while (!stoken.stop_requested()) {
        auto target = queue_.try_receive_for(std::chrono::milliseconds(500));

        if (!target) {
            if (queue_.is_closed()) break;
            continue;
        }

        try {
            refresh(*target);
        } catch (const std::exception& e) {
            LOG_ERROR(core::LogCategory::RESOLVER,
                      "Refresh of " + target->to_hex() + " failed: " +
                      e.what());
        }
        finish(*target);
    }
}

void RefreshPool::refresh(const dht::Id& target) {
    dht::GetValueRequest request{target, std::nullopt, std::nullopt};

    auto values = rpc_.get_mutable(target, request, options_.resolvers);
    completed_.fetch_add(1, std::memory_order_relaxed);

    if (!values.ok()) {
        LOG_DEBUG(core::LogCategory::DHT,
                  "Lookup for " + target.to_hex() + " failed: " +
                  values.error().format());
        return;
    }

    size_t stored = 0;
    for (const auto& value : values.value()) {
        auto packet = pkarr::MutableItem::from_dht(value).and_then(
            [](pkarr::MutableItem item) {
                return pkarr::SignedPacket::from_item(std::move(item));
            });
        if (!packet.ok()) {
            LOG_DEBUG(core::LogCategory::DHT,
                      "Discarding value from " + value.from.to_string() +
                      ": " + packet.error().format());
            continue;
        }
        if (packet.value().target() != target) {
            LOG_DEBUG(core::LogCategory::DHT,
                      "Discarding value from " + value.from.to_string() +
                      " signed for another target");
            continue;
        }
        if (cache_.put(packet.value()) != pkarr::PutOutcome::IGNORED) {
            ++stored;
        }
    }

    LOG_DEBUG(core::LogCategory::DHT,
              "Lookup for " + target.to_hex() + " returned " +
              std::to_string(values.value().size()) + " values, " +
              std::to_string(stored) + " stored");
}

void RefreshPool::finish(const dht::Id& target) {
    bool idle = false;
    {
        std::lock_guard lock(in_flight_mutex_);
        in_flight_.erase(target);
        idle = in_flight_.empty();
    }
    if (idle) idle_cv_.notify_all();
}

}  // namespace server
