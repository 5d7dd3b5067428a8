/** \file benchmark_config.h
\brief Run configuration of the difficulty benchmark.

The configuration is read from the command line by parse_args() and checked by
validate_config() before any trial runs.  Every problem is reported as an
InvalidConfiguration exception.
*/
#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>
#include "invalid_configuration.h"
#include "pow_core.h"

namespace powcurve
{
    struct BenchmarkConfig
    {
        std::vector<uint64_t> difficulties;
        size_t trial_count = 50;
        uint64_t max_attempts = std::numeric_limits<uint64_t>::max();
        double cap_factor = 100.0;         // 0 = use max_attempts as is
        double max_capped_fraction = 0.1;  // tolerated share of capped trials
        unsigned threads = 0;              // 0 = all cores
        std::string pow_name = "threshold";
        std::optional<Seed> seed;          // set = reproducible run
        std::string output_path;           // empty = stdout
        bool show_help = false;
    };

    /**
     * \brief Check a configuration against a proof-of-work function.
     *
     * \throws InvalidConfiguration on an empty, zero, repeated or decreasing
     *         difficulty list, a difficulty above pow.max_difficulty(), zero
     *         trials, zero max_attempts, or out-of-range cap settings.
     */
    void validate_config(const BenchmarkConfig &config, const PowFunction &pow);

    /**
     * \brief Attempt cap for one level.
     *
     * min(max_attempts, ceil(cap_factor * expected attempts)), at least 1,
     * or max_attempts when cap_factor is 0.
     */
    uint64_t attempts_cap_for(const BenchmarkConfig &config, const PowFunction &pow, uint64_t difficulty);

    /** \brief Difficulty levels used when none are given. */
    std::vector<uint64_t> default_difficulties(const std::string &pow_name);

    /**
     * \brief Expand a difficulty token, either "N" or inclusive "start:end:step".
     *
     * \throws InvalidConfiguration on malformed input or a zero step.
     */
    std::vector<uint64_t> parse_difficulty_range(const std::string &input);

    /**
     * \brief Parse the command line into a configuration.
     *
     * Does not validate the result; see validate_config().
     * \throws InvalidConfiguration on unknown options or unparsable values.
     */
    BenchmarkConfig parse_args(int argc, const char *const argv[]);

    /** \brief Usage text for `program`. */
    std::string usage(const std::string &program);
}
