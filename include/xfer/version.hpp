/*
 * Version macros for xfer.
 *
 * The build passes XFER_VERSION_* as compile definitions derived from the CMake project
 * version; the values below only apply when they are absent.
 */

#pragma once

#ifndef XFER_VERSION_MAJOR
#define XFER_VERSION_MAJOR 0
#endif

#ifndef XFER_VERSION_MINOR
#define XFER_VERSION_MINOR 0
#endif

#ifndef XFER_VERSION_PATCH
#define XFER_VERSION_PATCH 0
#endif

#ifndef XFER_VERSION_STRING
#define XFER_VERSION_STRING "0.0.0+dev"
#endif

#ifndef XFER_BUILD_DATE
#define XFER_BUILD_DATE __DATE__ " " __TIME__
#endif

#define XFER_VERSION_LONG_STRING XFER_VERSION_STRING " (built: " XFER_BUILD_DATE ")"

#if defined(__cplusplus)
namespace xfer {
namespace version {
constexpr int major_v = XFER_VERSION_MAJOR;
constexpr int minor_v = XFER_VERSION_MINOR;
constexpr int patch_v = XFER_VERSION_PATCH;
constexpr const char* string_v = XFER_VERSION_STRING;
constexpr const char* long_string_v = XFER_VERSION_LONG_STRING;
} // namespace version
} // namespace xfer
#endif
