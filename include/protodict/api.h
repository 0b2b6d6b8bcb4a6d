// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// api.h - DLL export/import macros for protodict

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for protodict library.
///
/// - When building protodict as a SHARED library:
///   - CMake defines PROTODICT_EXPORTS (private) and PROTODICT_SHARED (public)
///   - Functions/classes marked with PROTODICT_API are exported
///
/// - When building/using as a STATIC library:
///   - No macros defined, PROTODICT_API expands to nothing

#if defined(_WIN32) || defined(_WIN64)
    #ifdef PROTODICT_SHARED
        #ifdef PROTODICT_EXPORTS
            #define PROTODICT_API __declspec(dllexport)
        #else
            #define PROTODICT_API __declspec(dllimport)
        #endif
    #else
        #define PROTODICT_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(PROTODICT_SHARED) && defined(PROTODICT_EXPORTS)
        #define PROTODICT_API __attribute__((visibility("default")))
    #else
        #define PROTODICT_API
    #endif
#else
    #define PROTODICT_API
#endif
