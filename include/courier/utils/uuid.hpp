/**
 * @file uuid.hpp
 * @brief UUID v4 generation for connection and envelope identifiers.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#include "courier/utils/export.hpp"

#include <cstdint>
#include <string>

namespace courier {
namespace utils {

/**
 * @class UUIDGenerator
 * @brief Thread-safe RFC 4122 version 4 (random) UUID generator.
 *
 * Format: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, y in {8, 9, a, b}.
 */
class COURIER_UTILS_API UUIDGenerator {
public:
    /**
     * @brief Generate a new random UUID v4 string.
     */
    static std::string generate();

    /**
     * @brief Check the 8-4-4-4-12 hex layout (case-insensitive).
     */
    static bool isValid(const std::string& uuid);

    /**
     * @brief The all-zero UUID.
     */
    static std::string nil() {
        return "00000000-0000-0000-0000-000000000000";
    }
};

}  // namespace utils
}  // namespace courier
