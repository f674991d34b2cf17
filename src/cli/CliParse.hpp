#pragma once

// Command-line parsing for the avfcomp tool, kept header-only so the parse
// rules can be unit-tested without spawning the executable.

#include "avfcomp/Backend.hpp"
#include "avfcomp/Config.hpp"

#include <charconv>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace avfcomp::cli {

inline bool ParseI32(std::string_view s, int* out)
{
  if (!out) return false;
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

enum class Mode {
  None,
  Compress,
  Decompress,
  Verify,
  Inspect,
};

inline bool ParseMode(std::string_view s, Mode& out)
{
  if (s == "compress" || s == "c") {
    out = Mode::Compress;
  } else if (s == "decompress" || s == "d") {
    out = Mode::Decompress;
  } else if (s == "verify") {
    out = Mode::Verify;
  } else if (s == "inspect") {
    out = Mode::Inspect;
  } else {
    return false;
  }
  return true;
}

// Values given on the command line. Unset optionals leave the config layer
// underneath untouched.
struct CliArgs {
  Mode mode = Mode::None;
  std::vector<std::string> inputs;

  std::string outDir;
  std::string outPath;
  std::string configPath;

  std::optional<Backend> backend;
  std::optional<int> level;
  std::optional<std::string> logPath;
  std::optional<int> logKeep;
  std::optional<bool> verify;
  bool quiet = false;

  // inspect: treat the input as CVF.
  bool cvf = false;
  // Print the effective config as JSON and exit.
  bool printConfig = false;

  bool help = false;
  bool version = false;
};

// Returns false with a message on a usage error.
inline bool ParseCliArgs(int argc, const char* const* argv, CliArgs& out, std::string& outError)
{
  out = CliArgs{};
  outError.clear();

  auto needValue = [&](int& i, const std::string& flag, std::string& value) -> bool {
    if (i + 1 >= argc || !argv[i + 1]) {
      outError = flag + " requires a value";
      return false;
    }
    value = argv[++i];
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i] ? std::string(argv[i]) : std::string();
    std::string v;

    if (a == "-h" || a == "--help") {
      out.help = true;
    } else if (a == "--version") {
      out.version = true;
    } else if (a == "--print-config") {
      out.printConfig = true;
    } else if (a == "--verify") {
      out.verify = true;
    } else if (a == "--no-verify") {
      out.verify = false;
    } else if (a == "--quiet" || a == "-q") {
      out.quiet = true;
    } else if (a == "--cvf") {
      out.cvf = true;
    } else if (a == "--config") {
      if (!needValue(i, a, out.configPath)) return false;
    } else if (a == "--out-dir") {
      if (!needValue(i, a, out.outDir)) return false;
    } else if (a == "-o" || a == "--out") {
      if (!needValue(i, a, out.outPath)) return false;
    } else if (a == "--log") {
      if (!needValue(i, a, v)) return false;
      out.logPath = v;
    } else if (a == "--log-keep") {
      int n = 0;
      if (!needValue(i, a, v)) return false;
      if (!ParseI32(v, &n) || n < 0 || n > 100) {
        outError = "--log-keep expects an integer in 0..100";
        return false;
      }
      out.logKeep = n;
    } else if (a == "--backend") {
      Backend b = Backend::Lzma;
      if (!needValue(i, a, v)) return false;
      if (!ParseBackend(v, b)) {
        outError = "unknown backend '" + v + "' (plain, gzip, bzip2, lzma, sllz, auto)";
        return false;
      }
      out.backend = b;
    } else if (a == "--level") {
      int n = 0;
      if (!needValue(i, a, v)) return false;
      if (!ParseI32(v, &n) || n < 0 || n > 9) {
        outError = "--level expects an integer in 0..9";
        return false;
      }
      out.level = n;
    } else if (!a.empty() && a[0] == '-' && a != "-") {
      outError = "Unknown option: " + a;
      return false;
    } else if (out.mode == Mode::None) {
      if (!ParseMode(a, out.mode)) {
        outError = "unknown mode '" + a + "'";
        return false;
      }
    } else {
      out.inputs.push_back(a);
    }
  }

  if (out.help || out.version || out.printConfig) return true;

  if (out.mode == Mode::None) {
    outError = "no mode given";
    return false;
  }
  if (out.inputs.empty()) {
    outError = "no input files";
    return false;
  }
  if (!out.outPath.empty() && out.inputs.size() != 1) {
    outError = "-o needs exactly one input (use --out-dir for batches)";
    return false;
  }
  if (!out.outPath.empty() && !out.outDir.empty()) {
    outError = "-o and --out-dir are mutually exclusive";
    return false;
  }
  if (out.mode == Mode::Inspect && out.inputs.size() != 1) {
    outError = "inspect takes exactly one file";
    return false;
  }
  return true;
}

// Command line wins over config file and environment.
inline void ApplyCliOverrides(const CliArgs& args, CodecConfig& ioCfg)
{
  if (args.backend) ioCfg.backend = *args.backend;
  if (args.level) ioCfg.level = *args.level;
  if (args.logPath) ioCfg.logPath = *args.logPath;
  if (args.logKeep) ioCfg.logKeep = *args.logKeep;
  if (args.verify) ioCfg.verify = *args.verify;
  if (args.quiet) ioCfg.quiet = true;
}

// game.avf -> game.cvf (compress), game.cvf -> game.avf (decompress).
// With an out dir, the file name is kept and the directory replaced.
inline std::filesystem::path DeriveOutputPath(const std::filesystem::path& in, Mode mode, const std::string& outDir)
{
  std::filesystem::path out = outDir.empty() ? in : std::filesystem::path(outDir) / in.filename();
  out.replace_extension(mode == Mode::Compress ? ".cvf" : ".avf");
  return out;
}

inline std::filesystem::path OutputPathFor(const CliArgs& args, const std::string& in)
{
  return args.outPath.empty() ? DeriveOutputPath(in, args.mode, args.outDir) : std::filesystem::path(args.outPath);
}

// Inputs of one batch must not share an output file, or a later one would
// silently replace an earlier result. Paths are compared after making them
// absolute and lexically normal.
inline bool CheckDistinctOutputs(const CliArgs& args, std::string& outError)
{
  if (args.mode != Mode::Compress && args.mode != Mode::Decompress) return true;

  std::map<std::filesystem::path, std::string> seen;
  for (const std::string& in : args.inputs) {
    const std::filesystem::path out = OutputPathFor(args, in);
    std::error_code ec;
    std::filesystem::path key = std::filesystem::absolute(out, ec);
    if (ec) key = out;
    key = key.lexically_normal();

    const auto res = seen.emplace(key, in);
    if (!res.second) {
      outError = "'" + res.first->second + "' and '" + in + "' would both write " + out.string();
      return false;
    }
  }
  return true;
}

} // namespace avfcomp::cli
