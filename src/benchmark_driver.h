/** \file benchmark_driver.h
\brief Measure the search cost over a sequence of difficulty levels.

For every configured level the driver samples `trial_count` nonce searches,
aggregates them and immediately writes the formatted result line, so results
survive an interrupted run.  A level without solved trials is reported and the
run goes on; only configuration errors stop it, before any trial runs.

Typical use:

    auto pow = powcurve::make_pow_function(config.pow_name);
    powcurve::RunContext context = powcurve::make_run_context(config, *pow);
    powcurve::BenchmarkReport report = powcurve::run_benchmark(*pow, config, context, std::cout);
*/
#pragma once
#include <cstddef>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>
#include "benchmark_config.h"
#include "pow_core.h"
#include "stats_aggregator.h"

namespace powcurve
{
    /**
     * \brief Immutable facts about a run, fixed at startup.
     */
    struct RunContext
    {
        std::string cpu_label;
        std::string pow_name;
        Seed base_seed;
    };

    /**
     * \brief Results of a run in the order the levels were measured.
     */
    struct BenchmarkReport
    {
        RunContext context;
        std::vector<DifficultyResult> results;
        size_t degenerate_levels = 0;   ///< levels with NoSolvedTrials
        size_t overcapped_levels = 0;   ///< levels above the tolerated capped fraction

        bool clean() const { return degenerate_levels == 0 && overcapped_levels == 0; }

        /** \brief Mean of the finite aggregate hash rates, 0 if there is none. */
        double average_hash_rate() const;
    };

    /**
     * \brief Build the run context: detected CPU label and the base seed.
     *
     * The base seed is config.seed when set, otherwise random.
     */
    RunContext make_run_context(const BenchmarkConfig &config, const PowFunction &pow);

    /**
     * \brief Run the benchmark.
     *
     * \param pow     Proof-of-work function under test.
     * \param config  Validated here before anything runs.
     * \param context Run metadata, copied into the report.
     * \param out     Receives one result line per level, flushed per line.
     * \param log     Progress and diagnostics.
     * \throws InvalidConfiguration before the first trial.
     * \throws std::runtime_error when a result line cannot be written to `out`.
     */
    BenchmarkReport run_benchmark(const PowFunction &pow, const BenchmarkConfig &config,
                                  const RunContext &context, std::ostream &out,
                                  std::ostream &log = std::cerr);
}
