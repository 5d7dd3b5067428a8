#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <thread>
#include <vector>
#include "difficulty_sampler.h"

namespace sampler_internal
{
    /** \brief Starts a worker thread.  May throw std::system_error like the std::thread constructor.
        \see run_trials
         */
    using ThreadLauncher = std::function<std::thread(std::function<void()>)>;

    std::thread launch_thread(std::function<void()> task);

    // Fill `trials` using `total_threads` stripes.  Stripes whose thread could not be
    // started run on the calling thread; every started thread is joined before returning.
    void run_trials(const powcurve::PowFunction &pow, const powcurve::Seed &base_seed,
                    uint64_t difficulty, uint64_t max_attempts,
                    std::vector<powcurve::Trial> &trials, size_t total_threads,
                    const ThreadLauncher &launch);
}
