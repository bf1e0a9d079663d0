#pragma once

#define MOEBIUS_VERSION_MAJOR 0
#define MOEBIUS_VERSION_MINOR 2
#define MOEBIUS_VERSION_PATCH 0

#define MOEBIUS_VERSION_HEX ((MOEBIUS_VERSION_MAJOR<<16) | (MOEBIUS_VERSION_MINOR<<8) | (MOEBIUS_VERSION_PATCH))

namespace moebius {
inline constexpr int version_major = MOEBIUS_VERSION_MAJOR;
inline constexpr int version_minor = MOEBIUS_VERSION_MINOR;
inline constexpr int version_patch = MOEBIUS_VERSION_PATCH;
} // namespace moebius
