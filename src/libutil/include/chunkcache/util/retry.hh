#pragma once
///@file

#include "chunkcache/util/logging.hh"
#include "chunkcache/util/signals.hh"

#include <chrono>
#include <cmath>
#include <functional>
#include <random>
#include <thread>

namespace chunkcache {

/**
 * Exponential backoff with jitter, in milliseconds: roughly 250, 500,
 * 1000, ... for attempts 1, 2, 3, ...
 */
inline unsigned int retrySleepTime(unsigned int attempt)
{
    static thread_local std::mt19937 mt19937{std::random_device{}()};
    return 250.0 * std::pow(2.0f, attempt - 1 + std::uniform_real_distribution<>(0.0, 0.5)(mt19937));
}

/**
 * Call `f` up to `attempts` times, sleeping between attempts, as long
 * as it fails with an error whose `isTransient()` is true. Any other
 * error, or the last transient one, propagates.
 */
template<typename C>
C retry(unsigned int attempts, std::function<C()> && f)
{
    unsigned int attempt = 0;
    while (true) {
        try {
            return f();
        } catch (BaseError & e) {
            ++attempt;
            if (attempt >= attempts || !e.isTransient())
                throw;
            auto ms = retrySleepTime(attempt);
            warn("%s; retrying in %d ms", e.what(), ms);
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            checkInterrupt();
        }
    }
}

} // namespace chunkcache
