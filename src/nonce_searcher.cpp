// nonce_searcher.cpp
#include <chrono>
#include "nonce_searcher.h"
#include "pow_core_internal.h"

namespace powcurve
{
    Trial search_nonce(const PowFunction &pow, const Seed &seed, uint64_t difficulty, uint64_t max_attempts)
    {
        uint64_t nonce = pow_internal::load_u64_le(seed.data());
        uint64_t attempts = 0;

        auto start = std::chrono::steady_clock::now();

        while (attempts < max_attempts)
        {
            ++attempts;
            Hash candidate = pow.generate_candidate(seed, nonce);
            if (pow.meets_difficulty(candidate, difficulty))
            {
                std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
                return Trial{attempts, elapsed, TrialOutcome::Solved, nonce};
            }
            ++nonce; // wraps at 2^64
        }

        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
        return Trial{attempts, elapsed, TrialOutcome::CapExceeded, 0};
    }
}
