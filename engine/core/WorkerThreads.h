// Strided fan-out of indexed jobs over worker threads.
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "Logger.h"

namespace Engine {

using ThreadLauncher = std::function<std::thread(std::function<void()>)>;

inline std::thread launchThread(std::function<void()> body) { return std::thread(std::move(body)); }

// Runs job(i) for every i in [0, count). Worker w takes w, w + workers, ...
// A worker whose thread cannot be created has its share run on the calling thread.
// Returns the number of threads started.
inline std::size_t runStrided(std::size_t count, std::size_t workers, const std::function<void(std::size_t)>& job,
                              const ThreadLauncher& launch = launchThread) {
    const auto share = [&](std::size_t w) {
        for (std::size_t i = w; i < count; i += workers) job(i);
    };
    if (workers <= 1) {
        for (std::size_t i = 0; i < count; ++i) job(i);
        return 0;
    }

    std::vector<std::thread> pool;
    pool.reserve(workers);
    try {
        for (std::size_t w = 0; w < workers; ++w) pool.push_back(launch([&share, w] { share(w); }));
    } catch (const std::system_error& e) {
        logWarn("Started " + std::to_string(pool.size()) + " of " + std::to_string(workers) +
                " worker threads: " + e.what());
    }
    for (std::size_t w = pool.size(); w < workers; ++w) share(w);
    for (auto& th : pool) th.join();
    return pool.size();
}

}  // namespace Engine
