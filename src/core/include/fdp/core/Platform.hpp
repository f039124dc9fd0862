/**
 * @file Platform.hpp
 * @brief Compile-time compiler detection and portability macros.
 *
 * Provides branch-prediction hints used by the contract macros.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef FDP_CORE_PLATFORM_HPP
    #define FDP_CORE_PLATFORM_HPP

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define FDP_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define FDP_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define FDP_COMPILER_MSVC  1
    #else
        #define FDP_COMPILER_UNKNOWN 1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(FDP_COMPILER_GCC) || defined(FDP_COMPILER_CLANG)
        #define FDP_LIKELY(x)       __builtin_expect(!!(x), 1)
        #define FDP_UNLIKELY(x)     __builtin_expect(!!(x), 0)
    #elif defined(FDP_COMPILER_MSVC)
        #define FDP_LIKELY(x)       (x)
        #define FDP_UNLIKELY(x)     (x)
    #else
        #define FDP_LIKELY(x)       (x)
        #define FDP_UNLIKELY(x)     (x)
    #endif

#endif // FDP_CORE_PLATFORM_HPP
