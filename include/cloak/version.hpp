/*
 * Fallback version header for Cloak
 *
 * Provides default version macros so the codebase compiles even when the build
 * system does not pass them on the command line. CMake defines the real values
 * from project(VERSION ...).
 */

#pragma once

#ifndef CLOAK_VERSION_MAJOR
#define CLOAK_VERSION_MAJOR 0
#endif

#ifndef CLOAK_VERSION_MINOR
#define CLOAK_VERSION_MINOR 0
#endif

#ifndef CLOAK_VERSION_PATCH
#define CLOAK_VERSION_PATCH 0
#endif

#ifndef CLOAK_VERSION_STRING
#define CLOAK_VERSION_STRING "0.0.0+dev"
#endif

#ifndef CLOAK_BUILD_DATE
#define CLOAK_BUILD_DATE __DATE__ " " __TIME__
#endif

#define CLOAK_VERSION_LONG_STRING CLOAK_VERSION_STRING " (built: " CLOAK_BUILD_DATE ")"

#if defined(__cplusplus)
namespace cloak {
namespace version {
constexpr int major_v = CLOAK_VERSION_MAJOR;
constexpr int minor_v = CLOAK_VERSION_MINOR;
constexpr int patch_v = CLOAK_VERSION_PATCH;
constexpr const char* string_v = CLOAK_VERSION_STRING;
constexpr const char* long_string_v = CLOAK_VERSION_LONG_STRING;
} // namespace version
} // namespace cloak
#endif
