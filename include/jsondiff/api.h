// api.h - DLL export/import macros for jsondiff

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the jsondiff library.
///
/// Usage:
/// - When building jsondiff as a SHARED library:
///   - CMake defines JSONDIFF_EXPORTS (private) and JSONDIFF_SHARED (public)
///   - Functions/classes marked with JSONDIFF_API will be exported
///
/// - When using jsondiff as a SHARED library:
///   - Link against the jsondiff target (CMake propagates JSONDIFF_SHARED)
///   - Functions/classes marked with JSONDIFF_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, JSONDIFF_API expands to nothing

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef JSONDIFF_SHARED
        #ifdef JSONDIFF_EXPORTS
            #define JSONDIFF_API __declspec(dllexport)
        #else
            #define JSONDIFF_API __declspec(dllimport)
        #endif
    #else
        #define JSONDIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(JSONDIFF_SHARED) && defined(JSONDIFF_EXPORTS)
        #define JSONDIFF_API __attribute__((visibility("default")))
    #else
        #define JSONDIFF_API
    #endif
#else
    #define JSONDIFF_API
#endif

// ============================================================
// Template Export Helpers
// ============================================================

// Usage in header:  JSONDIFF_EXTERN_TEMPLATE struct BasicValue<Policy>;
// Usage in source:  template struct BasicValue<Policy>;
#define JSONDIFF_EXTERN_TEMPLATE extern template
