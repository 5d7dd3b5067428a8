/** \file pow_core.h
\brief Proof-of-work functions consumed by the benchmark harness.

A proof-of-work function turns a (seed, nonce) pair into a candidate hash and
decides whether that hash satisfies a given difficulty.  The harness only uses
the two operations below plus the expected search cost, so any concrete
construction can be swapped in behind PowFunction.

Concrete functions are created by name with make_pow_function():
  "threshold"     SHA-256(seed || nonce), first 64 bits <= UINT64_MAX / difficulty
  "leading-zeros" SHA-256(seed || nonce) with at least `difficulty` leading zero bits
  "modulo"        synthetic, accepts when nonce % difficulty == 0
*/
#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <string>

namespace powcurve
{
    /** \brief Candidate hash produced for one nonce. */
    using Hash = std::array<uint8_t, 32>;

    /** \brief Per-trial seed the nonces are combined with. */
    using Seed = std::array<uint8_t, 32>;

    /**
     * \brief Capability interface of a proof-of-work function.
     *
     * Implementations must be stateless or immutable: one instance is shared
     * by every worker thread of a sample.
     */
    class PowFunction
    {
    public:
        virtual ~PowFunction() = default;

        virtual std::string name() const = 0;

        /** \brief Compute the candidate hash for `nonce` under `seed`. */
        virtual Hash generate_candidate(const Seed &seed, uint64_t nonce) const = 0;

        /** \brief Acceptance predicate.  Stricter for larger difficulty. */
        virtual bool meets_difficulty(const Hash &hash, uint64_t difficulty) const = 0;

        /**
         * \brief Expected number of attempts until acceptance.
         *
         * \post Non-decreasing in `difficulty`.
         */
        virtual double expected_attempts(uint64_t difficulty) const = 0;

        /** \brief Largest difficulty this function can represent. */
        virtual uint64_t max_difficulty() const { return UINT64_MAX; }
    };

    /**
     * \brief Create a proof-of-work function by name.
     *
     * \throws InvalidConfiguration for an unknown name.
     */
    std::unique_ptr<PowFunction> make_pow_function(const std::string &name);

    /** \brief Lower-case hex rendering of a seed or hash. */
    std::string to_hex(const std::array<uint8_t, 32> &bytes);

    /**
     * \brief Parse exactly 64 hex digits into a seed.
     *
     * \throws InvalidConfiguration if the text is not 64 hex digits.
     */
    Seed parse_seed_hex(const std::string &hex);
}
