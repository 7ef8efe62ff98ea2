/**
 * @file Platform.hpp
 * @brief Compile-time platform detection and portability macros.
 *
 * Detects the target operating system and compiler, and provides
 * branch-prediction hints, the symbol-export macro used by loadable game
 * modules, and the platform's shared-library file extension.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef EMBER_CORE_PLATFORM_HPP
    #define EMBER_CORE_PLATFORM_HPP

// ---- Operating System ----------------------------------------------------

    #if defined(_WIN32) || defined(_WIN64)
        #define EMBER_OS_WINDOWS 1
    #elif defined(__APPLE__)
        #define EMBER_OS_MACOS   1
    #elif defined(__linux__)
        #define EMBER_OS_LINUX   1
    #else
        #define EMBER_OS_UNKNOWN 1
    #endif

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define EMBER_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define EMBER_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define EMBER_COMPILER_MSVC  1
    #else
        #define EMBER_COMPILER_UNKNOWN 1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(EMBER_COMPILER_GCC) || defined(EMBER_COMPILER_CLANG)
        #define EMBER_LIKELY(x)     __builtin_expect(!!(x), 1)
        #define EMBER_UNLIKELY(x)   __builtin_expect(!!(x), 0)
    #else
        #define EMBER_LIKELY(x)     (x)
        #define EMBER_UNLIKELY(x)   (x)
    #endif

// ---- Module export -------------------------------------------------------

    #if defined(EMBER_OS_WINDOWS)
        #define EMBER_MODULE_EXPORT extern "C" __declspec(dllexport)
    #elif defined(EMBER_COMPILER_GCC) || defined(EMBER_COMPILER_CLANG)
        #define EMBER_MODULE_EXPORT extern "C" __attribute__((visibility("default")))
    #else
        #define EMBER_MODULE_EXPORT extern "C"
    #endif

// ---- Shared library extension --------------------------------------------

namespace ember::core {

    #if defined(EMBER_OS_WINDOWS)
inline constexpr const char *kSharedLibraryExtension = ".dll";
    #elif defined(EMBER_OS_MACOS)
inline constexpr const char *kSharedLibraryExtension = ".dylib";
    #else
inline constexpr const char *kSharedLibraryExtension = ".so";
    #endif

} // namespace ember::core

#endif // EMBER_CORE_PLATFORM_HPP
