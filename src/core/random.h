#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace core {

// Fill |buf| with cryptographically secure random bytes (OpenSSL RAND_bytes).
// Throws std::runtime_error on failure.
void get_random_bytes(std::span<uint8_t> buf);

// Convenience wrapper that allocates and returns a vector of |count|
// cryptographically secure random bytes.
std::vector<uint8_t> get_random_bytes_vec(size_t count);

// ---------------------------------------------------------------------------
// InsecureRandom -- fast, non-cryptographic PRNG (xoshiro256**)
// ---------------------------------------------------------------------------
// Used for transaction ids and randomized tests.  Do NOT use for key
// material.
class InsecureRandom {
public:
    // If |seed| is 0 the generator is automatically seeded from the
    // cryptographic RNG (get_random_bytes).
    explicit InsecureRandom(uint64_t seed = 0);

    // Return the next pseudo-random 64-bit value.
    uint64_t next();

    // Return a uniform pseudo-random value in [0, max).
    // Throws std::invalid_argument if max == 0.
    uint64_t range(uint64_t max);

    // Return |count| pseudo-random bytes.
    std::vector<uint8_t> bytes(size_t count);

private:
    void seed_from(uint64_t value);

    std::array<uint64_t, 4> state_{};
};

}  // namespace core
