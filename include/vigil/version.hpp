/*
 * Fallback version header for Vigil
 *
 * The build system passes the real version through compile definitions; these
 * defaults keep the tree compiling when it does not.
 */

#pragma once

#ifndef VIGIL_VERSION_MAJOR
#define VIGIL_VERSION_MAJOR 0
#endif

#ifndef VIGIL_VERSION_MINOR
#define VIGIL_VERSION_MINOR 0
#endif

#ifndef VIGIL_VERSION_PATCH
#define VIGIL_VERSION_PATCH 0
#endif

#ifndef VIGIL_VERSION_STRING
#define VIGIL_VERSION_STRING "0.0.0+dev"
#endif

#ifndef VIGIL_BUILD_DATE
#define VIGIL_BUILD_DATE __DATE__ " " __TIME__
#endif

// "X.Y.Z+qual (built: YYYY-MM-DD HH:MM:SS)"
#ifndef VIGIL_VERSION_LONG_STRING
#define VIGIL_VERSION_LONG_STRING VIGIL_VERSION_STRING " (built: " VIGIL_BUILD_DATE ")"
#endif

#if defined(__cplusplus)
namespace vigil::version {
constexpr int major_v = VIGIL_VERSION_MAJOR;
constexpr int minor_v = VIGIL_VERSION_MINOR;
constexpr int patch_v = VIGIL_VERSION_PATCH;
constexpr const char* string_v = VIGIL_VERSION_STRING;
constexpr const char* long_string_v = VIGIL_VERSION_LONG_STRING;
} // namespace vigil::version
#endif
