/**
 * @file backoff.hpp
 * @brief Retry delay policies for the server retry path and client reconnects.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <vector>

namespace courier {
namespace core {

/**
 * @struct ExponentialBackoff
 * @brief delay(n) = min(base * multiplier^(n-1), cap), n >= 1.
 */
struct ExponentialBackoff {
    std::chrono::milliseconds base{2000};
    double multiplier = 2.0;
    std::chrono::milliseconds cap{30000};

    std::chrono::milliseconds delayFor(uint32_t retry) const {
        if (retry == 0) {
            retry = 1;
        }
        double factor = multiplier < 1.0 ? 1.0 : multiplier;
        double delay = static_cast<double>(base.count()) * std::pow(factor, static_cast<double>(retry - 1));
        double ceiling = static_cast<double>(std::max(cap, base).count());
        return std::chrono::milliseconds(static_cast<int64_t>(std::min(delay, ceiling)));
    }
};

/**
 * @class ReconnectSchedule
 * @brief Stepped delay table that repeats its last entry once exhausted.
 *
 * The table is made monotonically non-decreasing on construction, so a
 * misconfigured sequence can only ever wait longer, never shorter.
 */
class ReconnectSchedule {
public:
    ReconnectSchedule()
        : ReconnectSchedule({std::chrono::milliseconds(1000),
                             std::chrono::milliseconds(2000),
                             std::chrono::milliseconds(5000),
                             std::chrono::milliseconds(10000),
                             std::chrono::milliseconds(30000)}) {}

    explicit ReconnectSchedule(std::vector<std::chrono::milliseconds> steps)
        : steps_(std::move(steps)) {
        if (steps_.empty()) {
            steps_.push_back(std::chrono::milliseconds(1000));
        }
        for (size_t i = 1; i < steps_.size(); ++i) {
            steps_[i] = std::max(steps_[i], steps_[i - 1]);
        }
    }

    /**
     * @brief Delay before the given attempt (1-based).
     */
    std::chrono::milliseconds delayFor(uint32_t attempt) const {
        size_t index = attempt == 0 ? 0 : attempt - 1;
        return steps_[std::min(index, steps_.size() - 1)];
    }

    const std::vector<std::chrono::milliseconds>& steps() const { return steps_; }

private:
    std::vector<std::chrono::milliseconds> steps_;
};

}  // namespace core
}  // namespace courier
