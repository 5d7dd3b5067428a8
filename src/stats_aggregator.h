/** \file stats_aggregator.h
\brief Reduce a sample to per-difficulty statistics.

Only solved trials contribute.  The aggregate hash rate is total attempts over
total time of the solved trials, not the mean of the per-trial rates, so long
trials are not under-weighted.
*/
#pragma once
#include <cstddef>
#include <cstdint>
#include "difficulty_sampler.h"

namespace powcurve
{
    enum class ResultStatus
    {
        Ok,
        NoSolvedTrials
    };

    /**
     * \brief Statistics of one difficulty level.
     *
     * With status NoSolvedTrials the three statistics are NaN.
     */
    struct DifficultyResult
    {
        uint64_t difficulty;
        double mean_nonce_count;
        double mean_time;           ///< seconds
        double aggregate_hash_rate; ///< attempts per second
        size_t solved_count;
        size_t total_count;
        ResultStatus status;

        bool valid() const { return status == ResultStatus::Ok; }
        size_t capped_count() const { return total_count - solved_count; }
    };

    /**
     * \brief Aggregate a sample.
     *
     * If the solved trials took no measurable time the hash rate is +infinity.
     */
    DifficultyResult aggregate(const Sample &sample);
}
