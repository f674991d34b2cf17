#pragma once

#include <string>

// Build/version metadata. CMake defines these macros through avfcomp_core's
// PUBLIC compile definitions; the fallbacks keep the header usable elsewhere.

#ifndef AVFCOMP_VERSION_MAJOR
#define AVFCOMP_VERSION_MAJOR 0
#endif

#ifndef AVFCOMP_VERSION_MINOR
#define AVFCOMP_VERSION_MINOR 0
#endif

#ifndef AVFCOMP_VERSION_PATCH
#define AVFCOMP_VERSION_PATCH 0
#endif

#ifndef AVFCOMP_VERSION_STRING
#define AVFCOMP_VERSION_STRING "0.0.0"
#endif

#ifndef AVFCOMP_GIT_SHA
#define AVFCOMP_GIT_SHA "unknown"
#endif

namespace avfcomp {

inline constexpr const char* AvfCompVersionString()
{
  return AVFCOMP_VERSION_STRING;
}

inline constexpr const char* AvfCompGitSha()
{
  return AVFCOMP_GIT_SHA;
}

inline std::string AvfCompFullVersionString()
{
  std::string s = AvfCompVersionString();
  const std::string sha = AvfCompGitSha();
  if (!sha.empty() && sha != "unknown") {
    s += " (";
    s += sha;
    s += ")";
  }
  return s;
}

} // namespace avfcomp
