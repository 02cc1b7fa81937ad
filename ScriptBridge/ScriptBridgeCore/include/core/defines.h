#pragma once

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
    #define SB_PLATFORM_WINDOWS
#elif defined(__linux__)
    #define SB_PLATFORM_LINUX
#elif defined(__APPLE__)
    #define SB_PLATFORM_MACOS
#endif

// Export/Import macros
#if defined(SB_PLATFORM_WINDOWS)
    #ifdef SB_EXPORT
        #define SB_API __declspec(dllexport)
    #elif defined(SB_STATIC)
        #define SB_API
    #else
        #define SB_API __declspec(dllimport)
    #endif
#elif defined(SB_PLATFORM_LINUX) || defined(SB_PLATFORM_MACOS)
    #ifdef SB_EXPORT
        #define SB_API __attribute__((visibility("default")))
    #else
        #define SB_API
    #endif
#else
    #define SB_API
#endif
