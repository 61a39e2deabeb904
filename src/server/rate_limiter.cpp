// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "server/rate_limiter.h"

#include "core/logging.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace server {

RateLimiter::RateLimiter(Options options, core::Clock clock)
    : options_(options), clock_(std::move(clock)) {
    if (options_.window_ms <= 0) {
        throw std::invalid_argument("RateLimiter: window must be positive");
    }
    if (options_.max_tracked == 0) {
        throw std::invalid_argument("RateLimiter: max_tracked must be > 0");
    }
    if (!clock_) {
        throw std::invalid_argument("RateLimiter: clock must be set");
    }
}

bool RateLimiter::is_limited(const net::NetAddress& source) {
    const int64_t now = clock_();

    std::lock_guard lock(mutex_);

    if (++calls_ % SWEEP_INTERVAL == 0) {
        sweep_locked(now);
    }

    auto it = windows_.find(source);
    if (it == windows_.end()) {
        if (windows_.size() >= options_.max_tracked) {
            reclaim_oldest_locked();
        }
        lru_.push_front(source);
        it = windows_.emplace(source, Window{{}, now, lru_.begin()}).first;
    } else {
        lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
    }

    Window& w = it->second;
    w.last_seen = now;

    // Prune timestamps that fell out of the window.
    while (!w.requests.empty() &&
           now - w.requests.front() >= options_.window_ms) {
        w.requests.pop_front();
    }
    w.requests.push_back(now);

    // Bound memory for a source that hammers us inside one window.
    while (w.requests.size() > static_cast<size_t>(options_.max_requests) + 1) {
        w.requests.pop_front();
    }

    bool limited = w.requests.size() > options_.max_requests;
    if (limited) {
        LOG_TRACE(core::LogCategory::RATELIMIT,
                  source.to_string() + " exceeded " +
                  std::to_string(options_.max_requests) + " requests per " +
                  std::to_string(options_.window_ms) + "ms");
    }
    return limited;
}

size_t RateLimiter::sweep(int64_t now) {
    std::lock_guard lock(mutex_);
    return sweep_locked(now);
}

size_t RateLimiter::tracked() const {
    std::lock_guard lock(mutex_);
    return windows_.size();
}

size_t RateLimiter::sweep_locked(int64_t now) {
    size_t removed = 0;
    // The LRU tail holds the least recently active sources.
    while (!lru_.empty()) {
        auto it = windows_.find(lru_.back());
        if (it == windows_.end()) {
            lru_.pop_back();
            continue;
        }
        if (now - it->second.last_seen < options_.idle_ms) break;
        windows_.erase(it);
        lru_.pop_back();
        ++removed;
    }
    if (removed > 0) {
        LOG_DEBUG(core::LogCategory::RATELIMIT,
                  "reclaimed " + std::to_string(removed) +
                  " idle sources, tracking " +
                  std::to_string(windows_.size()));
    }
    return removed;
}

void RateLimiter::reclaim_oldest_locked() {
    if (lru_.empty()) return;
    windows_.erase(lru_.back());
    lru_.pop_back();
}

}  // namespace server
