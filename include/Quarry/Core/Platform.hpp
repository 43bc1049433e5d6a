#pragma once

// Platform Detection
#if defined(_WIN32) || defined(_WIN64)
    #define QUARRY_PLATFORM_WINDOWS 1
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
#elif defined(__APPLE__) && defined(__MACH__)
    #define QUARRY_PLATFORM_APPLE 1
#elif defined(__linux__)
    #define QUARRY_PLATFORM_LINUX 1
#elif defined(__unix__)
    #define QUARRY_PLATFORM_UNIX 1
#else
    #error "Unknown platform"
#endif

// Compiler Detection
#if defined(_MSC_VER)
    #define QUARRY_COMPILER_MSVC 1
    #define QUARRY_COMPILER_VERSION _MSC_VER
#elif defined(__clang__)
    #define QUARRY_COMPILER_CLANG 1
    #define QUARRY_COMPILER_VERSION (__clang_major__ * 10000 + __clang_minor__ * 100 + __clang_patchlevel__)
#elif defined(__GNUC__) || defined(__GNUG__)
    #define QUARRY_COMPILER_GCC 1
    #define QUARRY_COMPILER_VERSION (__GNUC__ * 10000 + __GNUC_MINOR__ * 100 + __GNUC_PATCHLEVEL__)
#else
    #error "Unknown compiler"
#endif

// Build configuration
#if !defined(QUARRY_BUILD_DEBUG) && !defined(QUARRY_BUILD_RELEASE)
    #if defined(NDEBUG)
        #define QUARRY_BUILD_RELEASE 1
    #else
        #define QUARRY_BUILD_DEBUG 1
    #endif
#endif
