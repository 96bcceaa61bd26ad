/**
 * @file uuid.cpp
 * @brief UUIDGenerator implementation.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#include "courier/utils/uuid.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace courier {
namespace utils {

std::string UUIDGenerator::generate() {
    thread_local std::random_device rd;
    thread_local std::mt19937_64 gen(rd());
    thread_local std::uniform_int_distribution<uint64_t> dist;

    uint64_t ab = dist(gen);
    uint64_t cd = dist(gen);

    // Version 4 in time_hi_and_version, variant 10xx in clock_seq_hi
    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8) << ((ab >> 32) & 0xFFFFFFFF) << "-";
    oss << std::setw(4) << ((ab >> 16) & 0xFFFF) << "-";
    oss << std::setw(4) << (ab & 0xFFFF) << "-";
    oss << std::setw(4) << ((cd >> 48) & 0xFFFF) << "-";
    oss << std::setw(12) << (cd & 0xFFFFFFFFFFFFULL);

    return oss.str();
}

bool UUIDGenerator::isValid(const std::string& uuid) {
    if (uuid.length() != 36) {
        return false;
    }

    for (size_t i = 0; i < uuid.length(); ++i) {
        char c = uuid[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (!((c >= '0' && c <= '9') ||
                     (c >= 'a' && c <= 'f') ||
                     (c >= 'A' && c <= 'F'))) {
            return false;
        }
    }

    return true;
}

}  // namespace utils
}  // namespace courier
