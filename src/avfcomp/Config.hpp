#pragma once

#include "avfcomp/Backend.hpp"
#include "avfcomp/Codec.hpp"

#include <string>

namespace avfcomp {

// Tool-level settings. Layering, lowest to highest priority:
//   defaults < JSON config file < environment < command line.
struct CodecConfig {
  Backend backend = Backend::Lzma;
  // -1: the backend's own default.
  int level = -1;
  bool verify = true;

  // Empty disables the log file.
  std::string logPath;
  int logKeep = 3;

  bool quiet = false;
};

inline CodecOptions MakeCodecOptions(const CodecConfig& cfg)
{
  CodecOptions opt;
  opt.backend.backend = cfg.backend == Backend::Auto ? Backend::Lzma : cfg.backend;
  opt.backend.level = cfg.level;
  opt.readBackend = Backend::Auto;
  opt.verify = cfg.verify;
  return opt;
}

} // namespace avfcomp
