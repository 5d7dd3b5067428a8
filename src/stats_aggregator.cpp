// stats_aggregator.cpp
#include <limits>
#include "stats_aggregator.h"

namespace powcurve
{
    DifficultyResult aggregate(const Sample &sample)
    {
        constexpr double nan = std::numeric_limits<double>::quiet_NaN();

        long double total_nonces = 0;
        double total_seconds = 0.0;
        size_t solved = 0;

        for (const Trial &trial : sample.trials)
        {
            if (!trial.solved())
                continue;
            total_nonces += trial.nonce_count;
            total_seconds += trial.elapsed.count();
            ++solved;
        }

        if (solved == 0)
        {
            return DifficultyResult{sample.difficulty, nan, nan, nan,
                                    0, sample.trials.size(), ResultStatus::NoSolvedTrials};
        }

        const double nonces = static_cast<double>(total_nonces);
        const double hash_rate = total_seconds > 0.0
                                     ? nonces / total_seconds
                                     : std::numeric_limits<double>::infinity();

        return DifficultyResult{sample.difficulty,
                                nonces / static_cast<double>(solved),
                                total_seconds / static_cast<double>(solved),
                                hash_rate,
                                solved,
                                sample.trials.size(),
                                ResultStatus::Ok};
    }
}
