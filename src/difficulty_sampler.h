/** \file difficulty_sampler.h
\brief Run a batch of independent nonce searches at one difficulty.
*/
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "nonce_searcher.h"
#include "pow_core.h"

namespace powcurve
{
    /**
     * \brief All trials run at one difficulty, in trial-index order.
     *
     * CapExceeded trials are kept so that they can be counted.
     */
    struct Sample
    {
        uint64_t difficulty;
        uint64_t max_attempts;
        std::vector<Trial> trials;

        size_t solved_count() const;
        size_t capped_count() const;
    };

    /**
     * \brief Seed of trial `trial_index` at `difficulty`.
     *
     * SHA-256(base_seed || difficulty || trial_index), integers as 8
     * little-endian bytes.  Distinct for every (difficulty, index) pair.
     */
    Seed derive_trial_seed(const Seed &base_seed, uint64_t difficulty, uint64_t trial_index);

    /**
     * \brief Run `trial_count` searches, spread over worker threads.
     *
     * Worker t runs trial indices t, t + threads, ... and all workers are
     * joined before returning.  An exception thrown by a worker is rethrown
     * here after the join.
     *
     * \param threads Worker count, 0 = std::thread::hardware_concurrency().
     */
    Sample sample_difficulty(const PowFunction &pow, const Seed &base_seed, uint64_t difficulty,
                             size_t trial_count, uint64_t max_attempts, unsigned threads = 0);
}
