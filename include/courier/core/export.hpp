/**
 * @file export.hpp
 * @brief Symbol visibility macros for the courier_core library.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(COURIER_CORE_BUILD)
        #define COURIER_CORE_API __declspec(dllexport)
    #else
        #define COURIER_CORE_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(COURIER_CORE_BUILD)
        #define COURIER_CORE_API __attribute__((visibility("default")))
    #else
        #define COURIER_CORE_API
    #endif
#else
    #define COURIER_CORE_API
#endif
