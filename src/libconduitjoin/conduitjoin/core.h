// =====================================================================
//  src/libconduitjoin/conduitjoin/core.h -- Library initialization and export macros
// =====================================================================
//
//  Part of libconduitjoin.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONDUITJOIN_CORE_H
#define CONDUITJOIN_CORE_H

// ---- Export macro ----------------------------------------------------
//
// When building libconduitjoin as a shared library, CONDUITJOIN_SHARED
// and CONDUITJOIN_BUILDING are defined.  Consumers linking against the
// shared library only see CONDUITJOIN_SHARED (set as a PUBLIC compile
// definition).

#if defined(CONDUITJOIN_SHARED)
  #if defined(CONDUITJOIN_BUILDING)
    #if defined(_WIN32)
      #define CONDUITJOIN_EXPORT __declspec(dllexport)
    #else
      #define CONDUITJOIN_EXPORT __attribute__((visibility("default")))
    #endif
  #else
    #if defined(_WIN32)
      #define CONDUITJOIN_EXPORT __declspec(dllimport)
    #else
      #define CONDUITJOIN_EXPORT
    #endif
  #endif
#else
  #define CONDUITJOIN_EXPORT
#endif

namespace conduitjoin {

/// Library version string (e.g., "0.1.0").
CONDUITJOIN_EXPORT const char* version();

/// Initialize library-wide state (logging filter rules).
/// Call once at application startup before using other functions.
/// Returns true on success.
CONDUITJOIN_EXPORT bool initialize();

/// Shut down the library and release resources.
/// Call once at application exit.
CONDUITJOIN_EXPORT void shutdown();

}  // namespace conduitjoin

#endif  // CONDUITJOIN_CORE_H
