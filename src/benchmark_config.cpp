// benchmark_config.cpp
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include "benchmark_config.h"

namespace
{
    using powcurve::InvalidConfiguration;

    uint64_t parse_u64(const std::string &text, const std::string &what)
    {
        if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c)
                                         { return std::isdigit(c) != 0; }))
        {
            throw InvalidConfiguration("Invalid " + what + ": '" + text + "'");
        }
        try
        {
            return std::stoull(text);
        }
        catch (const std::out_of_range &)
        {
            throw InvalidConfiguration(what + " out of range: " + text);
        }
    }

    double parse_double(const std::string &text, const std::string &what)
    {
        size_t used = 0;
        double value = 0.0;
        try
        {
            value = std::stod(text, &used);
        }
        catch (const std::logic_error &)
        {
            throw InvalidConfiguration("Invalid " + what + ": '" + text + "'");
        }
        if (used != text.size())
        {
            throw InvalidConfiguration("Invalid " + what + ": '" + text + "'");
        }
        return value;
    }

    std::vector<uint64_t> sequence(uint64_t start, uint64_t end, uint64_t step)
    {
        std::vector<uint64_t> values;
        for (uint64_t v = start; v <= end; v += step)
        {
            values.push_back(v);
            if (end - v < step)
                break;
        }
        return values;
    }
}

namespace powcurve
{
    void validate_config(const BenchmarkConfig &config, const PowFunction &pow)
    {
        if (config.difficulties.empty())
            throw InvalidConfiguration("No difficulty levels configured");

        for (size_t i = 0; i < config.difficulties.size(); ++i)
        {
            const uint64_t d = config.difficulties[i];
            if (d == 0)
                throw InvalidConfiguration("Difficulty 0 is not a valid level");
            if (d > pow.max_difficulty())
            {
                throw InvalidConfiguration("Difficulty " + std::to_string(d) + " exceeds the maximum " +
                                           std::to_string(pow.max_difficulty()) + " of " + pow.name());
            }
            if (i > 0 && d <= config.difficulties[i - 1])
            {
                throw InvalidConfiguration("Difficulty levels must be strictly increasing: " +
                                           std::to_string(config.difficulties[i - 1]) + " followed by " +
                                           std::to_string(d));
            }
        }

        if (config.trial_count == 0)
            throw InvalidConfiguration("Trial count must be at least 1");
        if (config.max_attempts == 0)
            throw InvalidConfiguration("max_attempts must be at least 1");
        if (!std::isfinite(config.cap_factor) || config.cap_factor < 0.0)
            throw InvalidConfiguration("Cap factor must be a finite value >= 0");
        if (!(config.max_capped_fraction >= 0.0 && config.max_capped_fraction <= 1.0))
            throw InvalidConfiguration("Tolerated capped fraction must lie in [0, 1]");
    }

    uint64_t attempts_cap_for(const BenchmarkConfig &config, const PowFunction &pow, uint64_t difficulty)
    {
        if (config.cap_factor <= 0.0)
            return config.max_attempts;

        // 2^64, the first double no longer representable as uint64_t
        constexpr double u64_limit = 18446744073709551616.0;

        const double derived = std::ceil(config.cap_factor * pow.expected_attempts(difficulty));
        if (!(derived < u64_limit))
            return config.max_attempts;
        const uint64_t cap = std::max<uint64_t>(1, static_cast<uint64_t>(derived));
        return std::min(cap, config.max_attempts);
    }

    std::vector<uint64_t> default_difficulties(const std::string &pow_name)
    {
        if (pow_name == "leading-zeros")
            return sequence(8, 20, 1);
        return sequence(1000, 10000, 1000);
    }

    std::vector<uint64_t> parse_difficulty_range(const std::string &input)
    {
        size_t first_colon = input.find(':');
        if (first_colon == std::string::npos)
        {
            return {parse_u64(input, "difficulty")};
        }

        size_t second_colon = input.find(':', first_colon + 1);
        if (second_colon == std::string::npos)
        {
            throw InvalidConfiguration("Range must be in the form start:end:step, got '" + input + "'");
        }

        uint64_t start = parse_u64(input.substr(0, first_colon), "range start");
        uint64_t end = parse_u64(input.substr(first_colon + 1, second_colon - first_colon - 1), "range end");
        uint64_t step = parse_u64(input.substr(second_colon + 1), "range step");

        if (step == 0)
            throw InvalidConfiguration("Step must be positive in range '" + input + "'");
        if (end < start)
            throw InvalidConfiguration("Range end is below its start in '" + input + "'");

        return sequence(start, end, step);
    }

    BenchmarkConfig parse_args(int argc, const char *const argv[])
    {
        BenchmarkConfig config;
        std::vector<uint64_t> difficulties;

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];

            auto value = [&]() -> std::string
            {
                if (i + 1 >= argc)
                    throw InvalidConfiguration("Missing value for " + arg);
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
            }
            else if (arg == "--trials")
            {
                config.trial_count = static_cast<size_t>(parse_u64(value(), "trial count"));
            }
            else if (arg == "--max-attempts")
            {
                config.max_attempts = parse_u64(value(), "max attempts");
            }
            else if (arg == "--cap-factor")
            {
                config.cap_factor = parse_double(value(), "cap factor");
            }
            else if (arg == "--max-capped")
            {
                config.max_capped_fraction = parse_double(value(), "capped fraction");
            }
            else if (arg == "--threads")
            {
                uint64_t threads = parse_u64(value(), "thread count");
                if (threads > 4096)
                    throw InvalidConfiguration("Thread count too large: " + std::to_string(threads));
                config.threads = static_cast<unsigned>(threads);
            }
            else if (arg == "--pow")
            {
                config.pow_name = value();
            }
            else if (arg == "--seed")
            {
                config.seed = parse_seed_hex(value());
            }
            else if (arg == "--output" || arg == "-o")
            {
                config.output_path = value();
            }
            else if (arg.size() > 1 && arg[0] == '-')
            {
                throw InvalidConfiguration("Unknown option: " + arg);
            }
            else
            {
                std::vector<uint64_t> levels = parse_difficulty_range(arg);
                difficulties.insert(difficulties.end(), levels.begin(), levels.end());
            }
        }

        config.difficulties = difficulties.empty() ? default_difficulties(config.pow_name) : difficulties;
        return config;
    }

    std::string usage(const std::string &program)
    {
        std::ostringstream out;
        out << "Usage: " << program << " [options] [difficulty | start:end:step]...\n"
            << "  --trials N        trials per difficulty (default 50)\n"
            << "  --max-attempts N  hard per-trial attempt cap\n"
            << "  --cap-factor X    per-level cap = X * expected attempts, 0 disables (default 100)\n"
            << "  --max-capped F    tolerated capped fraction per level (default 0.1)\n"
            << "  --threads N       worker threads, 0 = all cores (default 0)\n"
            << "  --pow NAME        threshold | leading-zeros | modulo (default threshold)\n"
            << "  --seed HEX        64 hex digit base seed for reproducible runs\n"
            << "  --output FILE     write result lines to FILE instead of stdout\n";
        return out.str();
    }
}
