// benchmark_driver_test.cpp
#include "../benchmark_driver.h"
#include <gtest/gtest.h>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "fake_pow.h"

namespace
{
    const powcurve::Seed fixed_seed = powcurve::parse_seed_hex(
        "e963a26e2f5712d662e5662e6ffd807b93d4a64f3c37861683dd18b922db7805");

    powcurve::RunContext test_context(const powcurve::PowFunction &pow)
    {
        return powcurve::RunContext{"Test CPU", pow.name(), fixed_seed};
    }

    powcurve::BenchmarkConfig config_for(std::vector<uint64_t> levels, size_t trials, uint64_t max_attempts)
    {
        powcurve::BenchmarkConfig config;
        config.difficulties = std::move(levels);
        config.trial_count = trials;
        config.max_attempts = max_attempts;
        config.cap_factor = 0.0;
        config.threads = 2;
        config.seed = fixed_seed;
        return config;
    }

    std::vector<std::string> lines_of(const std::string &text)
    {
        std::vector<std::string> lines;
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line))
            lines.push_back(line);
        return lines;
    }

    // Pattern the plotting script parses result lines with
    const std::regex line_regex(
        R"(Difficulty:\s*(\d+),\s*Average Nonce Count:\s*([\d\.]+),\s*Avg Time:\s*([\d\.]+)\s*s,\s*Aggregate Hash Rate:\s*([\d\.]+|inf) \(solutions/s\))");
}

TEST(RunBenchmark, ThreeLevels_ThreeAscendingLines)
{
    CountingModuloPow pow;
    std::ostringstream out, log;
    powcurve::BenchmarkReport report = powcurve::run_benchmark(
        pow, config_for({1, 2, 3}, 8, 100), test_context(pow), out, log);

    std::vector<std::string> lines = lines_of(out.str());
    ASSERT_EQ(3u, lines.size());

    uint64_t previous = 0;
    for (const std::string &line : lines)
    {
        std::smatch match;
        ASSERT_TRUE(std::regex_match(line, match, line_regex)) << line;
        uint64_t difficulty = std::stoull(match[1].str());
        EXPECT_GT(difficulty, previous);
        previous = difficulty;
    }

    ASSERT_EQ(3u, report.results.size());
    EXPECT_EQ(1u, report.results[0].difficulty);
    EXPECT_EQ(3u, report.results[2].difficulty);
    EXPECT_TRUE(report.clean());
    EXPECT_EQ("Test CPU", report.context.cpu_label);
    EXPECT_NE(std::string::npos, log.str().find("Measurement complete."));
}

TEST(RunBenchmark, ZeroTrials_NoTrialExecuted)
{
    CountingModuloPow pow;
    std::ostringstream out, log;
    EXPECT_THROW(powcurve::run_benchmark(pow, config_for({1, 2, 3}, 0, 100), test_context(pow), out, log),
                 powcurve::InvalidConfiguration);
    EXPECT_EQ(0u, pow.candidates.load());
    EXPECT_TRUE(out.str().empty());
}

TEST(RunBenchmark, DecreasingLevels_NoTrialExecuted)
{
    CountingModuloPow pow;
    std::ostringstream out, log;
    EXPECT_THROW(powcurve::run_benchmark(pow, config_for({1, 5, 3}, 4, 100), test_context(pow), out, log),
                 powcurve::InvalidConfiguration);
    EXPECT_EQ(0u, pow.candidates.load());
}

TEST(RunBenchmark, DegenerateLevel_RunContinues)
{
    RejectAllPow pow;
    std::ostringstream out, log;
    powcurve::BenchmarkReport report = powcurve::run_benchmark(
        pow, config_for({1, 2}, 3, 10), test_context(pow), out, log);

    std::vector<std::string> lines = lines_of(out.str());
    ASSERT_EQ(2u, lines.size());
    EXPECT_EQ("Difficulty: 1, Average Nonce Count: NaN, Avg Time: NaN s, Aggregate Hash Rate: NaN (solutions/s)",
              lines[0]);
    EXPECT_EQ(2u, report.degenerate_levels);
    EXPECT_FALSE(report.clean());
    EXPECT_DOUBLE_EQ(0.0, report.average_hash_rate());
    EXPECT_NE(std::string::npos, log.str().find("no trial solved at difficulty 2"));
}

TEST(RunBenchmark, TooManyCappedTrials_Flagged)
{
    CountingModuloPow pow;
    std::ostringstream out, log;
    // difficulty 1000 with a 10 attempt cap: most trials cannot reach a multiple
    powcurve::BenchmarkConfig config = config_for({2, 1000}, 20, 10);
    config.max_capped_fraction = 0.0;
    powcurve::BenchmarkReport report = powcurve::run_benchmark(pow, config, test_context(pow), out, log);

    ASSERT_EQ(2u, report.results.size());
    EXPECT_EQ(0u, report.results[0].capped_count());
    EXPECT_GT(report.results[1].capped_count(), 0u);
    EXPECT_FALSE(report.clean());
    EXPECT_EQ(2u, lines_of(out.str()).size());
}

TEST(RunBenchmark, IdenticalSeeds_IdenticalNonceCounts)
{
    auto pow = powcurve::make_pow_function("threshold");
    powcurve::BenchmarkConfig config = config_for({16, 64}, 12, 1000000);
    std::ostringstream out, log;

    powcurve::BenchmarkReport first = powcurve::run_benchmark(*pow, config, test_context(*pow), out, log);
    config.threads = 5;
    powcurve::BenchmarkReport second = powcurve::run_benchmark(*pow, config, test_context(*pow), out, log);

    ASSERT_EQ(first.results.size(), second.results.size());
    for (size_t i = 0; i < first.results.size(); ++i)
    {
        EXPECT_EQ(first.results[i].solved_count, second.results[i].solved_count);
        EXPECT_DOUBLE_EQ(first.results[i].mean_nonce_count, second.results[i].mean_nonce_count);
    }
}

TEST(RunBenchmark, MeanNonceCountGrowsWithDifficulty)
{
    auto pow = powcurve::make_pow_function("threshold");
    powcurve::BenchmarkConfig config = config_for({4, 64, 512}, 300, 1000000);
    config.threads = 0;
    std::ostringstream out, log;

    powcurve::BenchmarkReport report = powcurve::run_benchmark(*pow, config, test_context(*pow), out, log);

    ASSERT_EQ(3u, report.results.size());
    EXPECT_LT(report.results[0].mean_nonce_count, report.results[1].mean_nonce_count);
    EXPECT_LT(report.results[1].mean_nonce_count, report.results[2].mean_nonce_count);
    EXPECT_NEAR(64.0, report.results[1].mean_nonce_count, 20.0);
}

TEST(RunBenchmark, DerivedCapApplied)
{
    CountingModuloPow pow;
    powcurve::BenchmarkConfig config = config_for({1000}, 4, UINT64_MAX);
    config.cap_factor = 0.0005; // one attempt
    std::ostringstream out, log;

    powcurve::BenchmarkReport report = powcurve::run_benchmark(pow, config, test_context(pow), out, log);
    EXPECT_EQ(4u, pow.candidates.load());
    EXPECT_NE(std::string::npos, log.str().find("cap 1 attempts"));
    EXPECT_EQ(1u, report.results.size());
}

TEST(MakeRunContext, SeedFromConfig)
{
    CountingModuloPow pow;
    powcurve::BenchmarkConfig config = config_for({1}, 1, 1);
    powcurve::RunContext context = powcurve::make_run_context(config, pow);

    EXPECT_EQ(fixed_seed, context.base_seed);
    EXPECT_EQ("counting-modulo", context.pow_name);
    EXPECT_FALSE(context.cpu_label.empty());
}

TEST(MakeRunContext, RandomSeedWithoutConfig)
{
    CountingModuloPow pow;
    powcurve::BenchmarkConfig config = config_for({1}, 1, 1);
    config.seed.reset();

    EXPECT_NE(powcurve::make_run_context(config, pow).base_seed, powcurve::make_run_context(config, pow).base_seed);
}

namespace
{
    class FailingAtDifficultyPow : public CountingModuloPow
    {
    public:
        explicit FailingAtDifficultyPow(uint64_t failing) : failing_(failing) {}

        bool meets_difficulty(const powcurve::Hash &hash, uint64_t difficulty) const override
        {
            if (difficulty == failing_)
                throw std::runtime_error("predicate failure");
            return CountingModuloPow::meets_difficulty(hash, difficulty);
        }

    private:
        uint64_t failing_;
    };

    class SyncCountingBuf : public std::stringbuf
    {
    public:
        int syncs = 0;

    protected:
        int sync() override
        {
            ++syncs;
            return std::stringbuf::sync();
        }
    };
}

TEST(RunBenchmark, LaterLevelFails_EarlierLineAlreadyWritten)
{
    FailingAtDifficultyPow pow(2);
    std::ostringstream out, log;
    EXPECT_THROW(powcurve::run_benchmark(pow, config_for({1, 2}, 4, 100), test_context(pow), out, log),
                 std::runtime_error);

    std::vector<std::string> lines = lines_of(out.str());
    ASSERT_EQ(1u, lines.size());
    std::smatch match;
    ASSERT_TRUE(std::regex_match(lines[0], match, line_regex)) << lines[0];
    EXPECT_EQ("1", match[1].str());
}

TEST(RunBenchmark, EachLineFlushed)
{
    CountingModuloPow pow;
    SyncCountingBuf buffer;
    std::ostream out(&buffer);
    std::ostringstream log;

    powcurve::run_benchmark(pow, config_for({1, 2, 3}, 4, 100), test_context(pow), out, log);

    EXPECT_GE(buffer.syncs, 3);
    EXPECT_EQ(3u, lines_of(buffer.str()).size());
}

TEST(RunBenchmark, UnwritableOutput_Excepts)
{
    CountingModuloPow pow;
    std::ostream out(nullptr); // badbit set, every write fails
    std::ostringstream log;

    EXPECT_THROW(powcurve::run_benchmark(pow, config_for({1, 2}, 4, 100), test_context(pow), out, log),
                 std::runtime_error);
}

TEST(RunBenchmark, LogStreamFormattingUntouched)
{
    CountingModuloPow pow;
    std::ostringstream out, log;
    log.precision(6);
    const std::ios_base::fmtflags flags = log.flags();

    powcurve::run_benchmark(pow, config_for({1, 2}, 4, 100), test_context(pow), out, log);

    EXPECT_EQ(6, log.precision());
    EXPECT_EQ(flags, log.flags());
}
