#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>

namespace tinsel::sync {

/**
 * RetryPolicy - exponential backoff for failed remote writes.
 *
 *   delay(attempt) = min(max, base * 2^attempt) * jitter,  capped at max
 *
 * with jitter drawn from [0.5, 1.5) when enabled.
 */
struct RetryPolicy {
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds max{300000};
    bool jitter = true;

    [[nodiscard]] std::chrono::milliseconds delay(int attempt) const {
        // 2^20 already exceeds any sane max/base ratio.
        const auto exponent = std::clamp(attempt, 0, 20);
        // Saturate before shifting so a huge base cannot overflow.
        const auto scaled = base.count() > (max.count() >> exponent)
            ? max.count()
            : std::min<int64_t>(base.count() * (int64_t{1} << exponent), max.count());
        if (!jitter) {
            return std::chrono::milliseconds(scaled);
        }
        static thread_local std::mt19937_64 gen(std::random_device{}());
        std::uniform_real_distribution<double> factor(0.5, 1.5);
        const auto jittered = static_cast<int64_t>(static_cast<double>(scaled) * factor(gen));
        return std::chrono::milliseconds(std::min<int64_t>(jittered, max.count()));
    }
};

} // namespace tinsel::sync
