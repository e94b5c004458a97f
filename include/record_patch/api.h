// api.h - DLL export/import macros for record_patch

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the record_patch library.
///
/// Usage:
/// - When building record_patch as a SHARED library:
///   - CMake defines RECORD_PATCH_EXPORTS (private) and RECORD_PATCH_SHARED (public)
///   - Functions/classes marked with RECORD_PATCH_API will be exported
///
/// - When using record_patch as a SHARED library:
///   - Link against the record_patch target (CMake propagates RECORD_PATCH_SHARED)
///   - Functions/classes marked with RECORD_PATCH_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, RECORD_PATCH_API expands to nothing

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef RECORD_PATCH_SHARED
        #ifdef RECORD_PATCH_EXPORTS
            #define RECORD_PATCH_API __declspec(dllexport)
        #else
            #define RECORD_PATCH_API __declspec(dllimport)
        #endif
    #else
        #define RECORD_PATCH_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(RECORD_PATCH_SHARED) && defined(RECORD_PATCH_EXPORTS)
        #define RECORD_PATCH_API __attribute__((visibility("default")))
    #else
        #define RECORD_PATCH_API
    #endif
#else
    #define RECORD_PATCH_API
#endif

// For explicit template instantiation in shared libraries
// Usage in header:  RECORD_PATCH_EXTERN_TEMPLATE struct BasicValue<...>;
// Usage in source:  template struct BasicValue<...>;
#define RECORD_PATCH_EXTERN_TEMPLATE extern template
