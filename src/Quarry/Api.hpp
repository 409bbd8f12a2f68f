// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(__GNUC__)
    #define QUARRY_NO_EXPORT    __attribute__((visibility("hidden")))
    #define QUARRY_EXPORT       __attribute__((visibility("default")))
    #define QUARRY_IMPORT       /*!*/
    #define QUARRY_FORCE_INLINE __attribute__((always_inline))
#elif defined(_MSC_VER)
    #define QUARRY_NO_EXPORT    /*!*/
    #define QUARRY_EXPORT       __declspec(dllexport)
    #define QUARRY_IMPORT       __declspec(dllimport)
    #define QUARRY_FORCE_INLINE __forceinline
#endif

#if defined(QUARRY_SHARED)
    #if defined(BUILD_QUARRY)
        #define QUARRY_API QUARRY_EXPORT
    #else
        #define QUARRY_API QUARRY_IMPORT
    #endif
#else
    #define QUARRY_API /*!*/
#endif
