#pragma once
#include <cstddef>
#include <cstdint>
#include "pow_core.h"

namespace pow_internal
{
    /** \brief Size of the SHA-256 input: seed followed by the nonce.
        \see Sha256ThresholdPow
         */
    constexpr size_t INPUT_SIZE = 32 + sizeof(uint64_t);

    /** \brief Hex digits used by to_hex. */
    const char hex_digits[] = "0123456789abcdef";

    // SHA-256(seed || nonce as 8 little-endian bytes)
    powcurve::Hash sha256_candidate(const powcurve::Seed &seed, uint64_t nonce);

    // First 8 bytes of the hash read as a big-endian integer
    uint64_t hash_prefix_u64(const powcurve::Hash &hash);

    // Largest accepted prefix for a threshold difficulty, UINT64_MAX / difficulty
    uint64_t target_for_difficulty(uint64_t difficulty);

    bool has_leading_zeros(const uint8_t *digest, int bits_required);

    void store_u64_le(uint64_t value, uint8_t *output);

    uint64_t load_u64_le(const uint8_t *input);
}
