#pragma once

// Build/version info.
//
// CMake defines CRYPTGEN_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef CRYPTGEN_VERSION
#define CRYPTGEN_VERSION "dev"
#endif

#ifndef CRYPTGEN_APPNAME
#define CRYPTGEN_APPNAME "CryptGen"
#endif
