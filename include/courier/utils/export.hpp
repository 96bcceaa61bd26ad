/**
 * @file export.hpp
 * @brief Symbol visibility macros for the courier_utils library.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(COURIER_UTILS_BUILD)
        #define COURIER_UTILS_API __declspec(dllexport)
    #else
        #define COURIER_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(COURIER_UTILS_BUILD)
        #define COURIER_UTILS_API __attribute__((visibility("default")))
    #else
        #define COURIER_UTILS_API
    #endif
#else
    #define COURIER_UTILS_API
#endif
