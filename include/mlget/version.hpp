/*
 * Fallback version header for mlget
 *
 * The build system passes the real values as compile definitions; these
 * defaults keep the sources compiling when it does not.
 */

#pragma once

#ifndef MLGET_VERSION_MAJOR
#define MLGET_VERSION_MAJOR 0
#endif

#ifndef MLGET_VERSION_MINOR
#define MLGET_VERSION_MINOR 0
#endif

#ifndef MLGET_VERSION_PATCH
#define MLGET_VERSION_PATCH 0
#endif

#ifndef MLGET_VERSION_STRING
#define MLGET_VERSION_STRING "0.0.0+dev"
#endif
