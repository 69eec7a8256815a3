#pragma once

/// @file export.hpp
/// Cross-platform shared-library symbol visibility macro.
///
/// Build-system defines (set automatically by CMake):
///   SVCLOC_BUILDING: defined when compiling the svcloc library itself
///   SVCLOC_STATIC: define when building/linking svcloc as a static lib

#if defined(SVCLOC_STATIC)
  #define SVCLOC_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
  #ifdef SVCLOC_BUILDING
    #define SVCLOC_EXPORT __declspec(dllexport)
  #else
    #define SVCLOC_EXPORT __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define SVCLOC_EXPORT __attribute__((visibility("default")))
#else
  #define SVCLOC_EXPORT
#endif
