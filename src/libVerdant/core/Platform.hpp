#pragma once

// ============================================================================
// Platform macros
// VERDANT_PLATFORM_* is set by CMake
// ============================================================================

#if defined(VERDANT_PLATFORM_WINDOWS)
    #define VD_WINDOWS 1
#elif defined(VERDANT_PLATFORM_LINUX)
    #define VD_LINUX 1
#elif defined(VERDANT_PLATFORM_MACOS)
    #define VD_MACOS 1
#else
    #error "Verdant builds on Windows, Linux or macOS only."
#endif

#if defined(VD_WINDOWS)
    #if defined(VD_BUILD_SHARED)
        #define VD_API __declspec(dllexport)
    #elif defined(VD_USE_SHARED)
        #define VD_API __declspec(dllimport)
    #else
        #define VD_API
    #endif
#else
    #define VD_API __attribute__((visibility("default")))
#endif

// HDF5 and OpenEXR headers are noisy under -Wall -Wextra
#if defined(_MSC_VER)
    #define VD_DISABLE_WARNINGS_PUSH __pragma(warning(push, 0))
    #define VD_DISABLE_WARNINGS_POP  __pragma(warning(pop))
#else
    #define VD_DISABLE_WARNINGS_PUSH \
        _Pragma("GCC diagnostic push") \
        _Pragma("GCC diagnostic ignored \"-Wall\"") \
        _Pragma("GCC diagnostic ignored \"-Wextra\"")
    #define VD_DISABLE_WARNINGS_POP _Pragma("GCC diagnostic pop")
#endif

namespace verdant {

/// "<os>/<build type>", logged once at startup
constexpr const char* BuildDescription() {
#if defined(VD_WINDOWS)
    #define VD_OS_NAME "windows"
#elif defined(VD_MACOS)
    #define VD_OS_NAME "macos"
#else
    #define VD_OS_NAME "linux"
#endif
#if defined(NDEBUG)
    return VD_OS_NAME "/release";
#else
    return VD_OS_NAME "/debug";
#endif
#undef VD_OS_NAME
}

} // namespace verdant
