// benchmark_driver.cpp
#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include "benchmark_driver.h"
#include "difficulty_sampler.h"
#include "pow_core_internal.h"
#include "result_formatter.h"
#include "system_info.h"

namespace
{
    powcurve::Seed random_seed()
    {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist(0, UINT64_MAX);

        powcurve::Seed seed{};
        for (size_t i = 0; i < seed.size(); i += 8)
        {
            pow_internal::store_u64_le(dist(gen), seed.data() + i);
        }
        return seed;
    }
}

namespace powcurve
{
    double BenchmarkReport::average_hash_rate() const
    {
        double sum = 0.0;
        size_t count = 0;
        for (const DifficultyResult &result : results)
        {
            if (result.valid() && std::isfinite(result.aggregate_hash_rate))
            {
                sum += result.aggregate_hash_rate;
                ++count;
            }
        }
        return count == 0 ? 0.0 : sum / static_cast<double>(count);
    }

    RunContext make_run_context(const BenchmarkConfig &config, const PowFunction &pow)
    {
        return RunContext{detect_cpu_label(), pow.name(), config.seed ? *config.seed : random_seed()};
    }

    BenchmarkReport run_benchmark(const PowFunction &pow, const BenchmarkConfig &config,
                                  const RunContext &context, std::ostream &out, std::ostream &log)
    {
        validate_config(config, pow);

        BenchmarkReport report{context, {}};
        report.results.reserve(config.difficulties.size());

        log << "[*] CPU: " << context.cpu_label << "\n"
            << "[*] PoW function: " << context.pow_name << "\n"
            << "[*] Base seed: " << to_hex(context.base_seed) << "\n";

        for (uint64_t difficulty : config.difficulties)
        {
            const uint64_t cap = attempts_cap_for(config, pow, difficulty);
            log << "[*] Measuring difficulty: " << difficulty << " (" << config.trial_count
                << " samples, cap " << cap << " attempts)..." << std::endl;

            Sample sample = sample_difficulty(pow, context.base_seed, difficulty,
                                              config.trial_count, cap, config.threads);
            DifficultyResult result = aggregate(sample);

            const size_t capped = result.capped_count();
            if (capped > 0)
            {
                log << "[!] Warning: skipped " << capped << " of " << result.total_count
                    << " trials at difficulty " << difficulty << " (attempt cap " << cap << " reached)\n";
            }
            if (!result.valid())
            {
                ++report.degenerate_levels;
                log << "[!] Error: no trial solved at difficulty " << difficulty
                    << "; the level has no statistics\n";
            }
            else if (static_cast<double>(capped) > config.max_capped_fraction * static_cast<double>(result.total_count))
            {
                ++report.overcapped_levels;
                log << "[!] Error: " << capped << "/" << result.total_count
                    << " trials capped at difficulty " << difficulty
                    << "; the attempt cap is too low for this level and the mean is biased low\n";
            }

            report.results.push_back(result);
            out << format_result(result) << std::endl;
            if (!out)
            {
                throw std::runtime_error("Cannot write the result line for difficulty " + std::to_string(difficulty));
            }
        }

        std::ostringstream rate;
        rate << std::fixed << std::setprecision(2) << report.average_hash_rate();
        log << "[*] Overall average aggregate hash rate: " << rate.str() << " (solutions/s)\n"
            << "[*] Measurement complete." << std::endl;

        return report;
    }
}
