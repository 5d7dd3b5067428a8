#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include "../pow_core.h"
#include "../pow_core_internal.h"

/** \brief Accepts nonces divisible by the difficulty and counts its calls. */
class CountingModuloPow : public powcurve::PowFunction
{
public:
    std::string name() const override { return "counting-modulo"; }

    powcurve::Hash generate_candidate(const powcurve::Seed &, uint64_t nonce) const override
    {
        ++candidates;
        powcurve::Hash hash{};
        pow_internal::store_u64_le(nonce, hash.data());
        return hash;
    }

    bool meets_difficulty(const powcurve::Hash &hash, uint64_t difficulty) const override
    {
        return pow_internal::load_u64_le(hash.data()) % difficulty == 0;
    }

    double expected_attempts(uint64_t difficulty) const override { return static_cast<double>(difficulty); }

    mutable std::atomic<uint64_t> candidates{0};
};

/** \brief Never accepts a candidate. */
class RejectAllPow : public powcurve::PowFunction
{
public:
    std::string name() const override { return "reject-all"; }

    powcurve::Hash generate_candidate(const powcurve::Seed &seed, uint64_t) const override { return seed; }

    bool meets_difficulty(const powcurve::Hash &, uint64_t) const override { return false; }

    double expected_attempts(uint64_t difficulty) const override { return static_cast<double>(difficulty); }
};

/** \brief Seed whose starting nonce (first 8 bytes, little endian) is `start`. */
inline powcurve::Seed seed_starting_at(uint64_t start)
{
    powcurve::Seed seed{};
    pow_internal::store_u64_le(start, seed.data());
    return seed;
}
