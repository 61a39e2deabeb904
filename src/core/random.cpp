#include "random.h"

#include <bit>
#include <stdexcept>

#include <openssl/rand.h>

namespace core {

// ---------------------------------------------------------------------------
// Cryptographic helpers
// ---------------------------------------------------------------------------

void get_random_bytes(std::span<uint8_t> buf) {
    if (buf.empty()) {
        return;
    }
    // RAND_bytes returns 1 on success, 0 or -1 on failure.
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error(
            "core::get_random_bytes: RAND_bytes failed"
        );
    }
}

std::vector<uint8_t> get_random_bytes_vec(size_t count) {
    std::vector<uint8_t> result(count);
    if (count > 0) {
        get_random_bytes(result);
    }
    return result;
}

// ---------------------------------------------------------------------------
// InsecureRandom -- xoshiro256** implementation
// ---------------------------------------------------------------------------

// splitmix64 expands a single 64-bit seed into the 256-bit state.
static uint64_t splitmix64(uint64_t& state) {
    state += 0x9E3779B97F4A7C15ULL;
    uint64_t z = state;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

void InsecureRandom::seed_from(uint64_t value) {
    uint64_t sm = value;
    for (auto& s : state_) {
        s = splitmix64(sm);
    }
}

InsecureRandom::InsecureRandom(uint64_t seed) {
    if (seed == 0) {
        uint64_t fresh = 0;
        get_random_bytes(std::span<uint8_t>(
            reinterpret_cast<uint8_t*>(&fresh), sizeof(fresh)));
        // splitmix64 never yields an all-zero state.
        seed_from(fresh);
    } else {
        seed_from(seed);
    }
}

uint64_t InsecureRandom::next() {
    // xoshiro256** -- Blackman & Vigna 2018.
    const uint64_t result = std::rotl(state_[1] * 5, 7) * 9;
    const uint64_t t = state_[1] << 17;

    state_[2] ^= state_[0];
    state_[3] ^= state_[1];
    state_[1] ^= state_[2];
    state_[0] ^= state_[3];

    state_[2] ^= t;
    state_[3] = std::rotl(state_[3], 45);

    return result;
}

uint64_t InsecureRandom::range(uint64_t max) {
    if (max == 0) {
        throw std::invalid_argument(
            "InsecureRandom::range: max must be > 0"
        );
    }
    if (max == 1) {
        return 0;
    }

    // Rejection sampling: reject the tail that would bias value % max.
    const uint64_t threshold = (-max) % max;  // (2^64 - max) % max

    for (;;) {
        const uint64_t value = next();
        if (value >= threshold) {
            return value % max;
        }
    }
}

std::vector<uint8_t> InsecureRandom::bytes(size_t count) {
    std::vector<uint8_t> out(count);
    for (size_t i = 0; i < count; i += 8) {
        uint64_t word = next();
        for (size_t j = 0; j < 8 && i + j < count; ++j) {
            out[i + j] = static_cast<uint8_t>(word >> (8 * j));
        }
    }
    return out;
}

}  // namespace core
