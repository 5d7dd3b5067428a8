/** \file nonce_searcher.h
\brief Sequential nonce search for one trial.

Starting from an offset taken from the seed, nonces are tried one after the
other until the proof-of-work function accepts a candidate or the attempt
budget is spent.  The number of attempts and the wall-clock time are recorded
in a Trial.
*/
#pragma once
#include <chrono>
#include <cstdint>
#include "pow_core.h"

namespace powcurve
{
    enum class TrialOutcome
    {
        Solved,
        CapExceeded
    };

    /**
     * \brief Result of one nonce search.
     *
     * For CapExceeded trials nonce_count equals the attempt cap and nonce is 0.
     */
    struct Trial
    {
        uint64_t nonce_count;
        std::chrono::duration<double> elapsed;
        TrialOutcome outcome;
        uint64_t nonce;

        bool solved() const { return outcome == TrialOutcome::Solved; }
    };

    /**
     * \brief Search for a nonce meeting `difficulty`.
     *
     * \pre max_attempts > 0
     * \post Same seed and difficulty give the same nonce_count and outcome.
     *
     * \param pow          Proof-of-work function.
     * \param seed         Trial seed; its first 8 bytes give the starting nonce.
     * \param difficulty   Difficulty passed to meets_difficulty.
     * \param max_attempts Attempt budget.
     * \return Trial, Solved on the first accepted candidate.
     */
    Trial search_nonce(const PowFunction &pow, const Seed &seed, uint64_t difficulty, uint64_t max_attempts);
}
