// difficulty_sampler.cpp
#include <algorithm>
#include <cstring>
#include <exception>
#include <iostream>
#include <openssl/sha.h>
#include <system_error>
#include <thread>
#include "difficulty_sampler.h"
#include "difficulty_sampler_internal.h"
#include "pow_core_internal.h"

namespace
{
    void sample_worker(const powcurve::PowFunction &pow, const powcurve::Seed &base_seed,
                       uint64_t difficulty, uint64_t max_attempts,
                       std::vector<powcurve::Trial> &trials, std::exception_ptr &error,
                       size_t thread_id, size_t total_threads)
    {
        try
        {
            for (size_t i = thread_id; i < trials.size(); i += total_threads)
            {
                powcurve::Seed seed = powcurve::derive_trial_seed(base_seed, difficulty, i);
                trials[i] = powcurve::search_nonce(pow, seed, difficulty, max_attempts);
            }
        }
        catch (...)
        {
            error = std::current_exception();
        }
    }
}

namespace sampler_internal
{
    std::thread launch_thread(std::function<void()> task)
    {
        return std::thread(std::move(task));
    }

    void run_trials(const powcurve::PowFunction &pow, const powcurve::Seed &base_seed,
                    uint64_t difficulty, uint64_t max_attempts,
                    std::vector<powcurve::Trial> &trials, size_t total_threads,
                    const ThreadLauncher &launch)
    {
        std::vector<std::exception_ptr> errors(total_threads);
        std::vector<std::thread> workers;
        workers.reserve(total_threads);

        size_t started = 0;
        try
        {
            for (; started < total_threads; ++started)
            {
                const size_t id = started;
                workers.push_back(launch([&, id]()
                                         { sample_worker(pow, base_seed, difficulty, max_attempts,
                                                         trials, errors[id], id, total_threads); }));
            }
        }
        catch (const std::system_error &e)
        {
            std::cerr << "[!] Warning: started " << started << " of " << total_threads
                      << " worker threads (" << e.what() << "); running the rest inline\n";
        }

        // stripes without a thread
        for (size_t id = started; id < total_threads; ++id)
        {
            sample_worker(pow, base_seed, difficulty, max_attempts, trials, errors[id], id, total_threads);
        }

        for (auto &t : workers)
        {
            if (t.joinable())
                t.join();
        }

        for (const auto &error : errors)
        {
            if (error)
                std::rethrow_exception(error);
        }
    }
}

namespace powcurve
{
    size_t Sample::solved_count() const
    {
        return static_cast<size_t>(std::count_if(trials.begin(), trials.end(),
                                                 [](const Trial &t)
                                                 { return t.solved(); }));
    }

    size_t Sample::capped_count() const
    {
        return trials.size() - solved_count();
    }

    Seed derive_trial_seed(const Seed &base_seed, uint64_t difficulty, uint64_t trial_index)
    {
        unsigned char input[32 + 2 * sizeof(uint64_t)];
        std::memcpy(input, base_seed.data(), base_seed.size());
        pow_internal::store_u64_le(difficulty, input + 32);
        pow_internal::store_u64_le(trial_index, input + 40);

        Seed seed{};
        SHA256(input, sizeof(input), seed.data());
        return seed;
    }

    Sample sample_difficulty(const PowFunction &pow, const Seed &base_seed, uint64_t difficulty,
                             size_t trial_count, uint64_t max_attempts, unsigned threads)
    {
        Sample sample{difficulty, max_attempts, {}};
        if (trial_count == 0)
            return sample;

        sample.trials.assign(trial_count, Trial{0, std::chrono::duration<double>::zero(), TrialOutcome::CapExceeded, 0});

        size_t max_threads = threads != 0 ? threads : std::thread::hardware_concurrency();
        if (max_threads < 1)
        {
            max_threads = 1;
        }
        max_threads = std::min(max_threads, trial_count);

        sampler_internal::run_trials(pow, base_seed, difficulty, max_attempts, sample.trials,
                                     max_threads, sampler_internal::launch_thread);

        return sample;
    }
}
