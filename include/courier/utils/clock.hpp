/**
 * @file clock.hpp
 * @brief Wall-clock helpers shared by the wire and storage layers.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace courier {
namespace utils {

/**
 * @brief Milliseconds since the Unix epoch (system clock).
 */
inline int64_t epochMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace utils
}  // namespace courier
