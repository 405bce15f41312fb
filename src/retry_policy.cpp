#include "retry_policy.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <random>

namespace {
    double randomUnit() {
        static std::mutex generator_mutex;
        static std::mt19937 generator{std::random_device{}()};
        std::uniform_real_distribution<double> distribution(0.0, 1.0);
        std::lock_guard<std::mutex> lock(generator_mutex);
        return distribution(generator);
    }
}

std::chrono::milliseconds RetryPolicy::backoffFor(int failed_attempt) const {
    double base = static_cast<double>(initial_backoff.count()) *
                  std::pow(backoff_multiplier, std::max(0, failed_attempt - 1));
    base = std::min(base, static_cast<double>(max_backoff.count()));

    double factor = 1.0 - std::clamp(jitter, 0.0, 1.0) * randomUnit();
    return std::chrono::milliseconds(static_cast<std::int64_t>(base * factor));
}
