#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace avfcomp {

// RAII helper that duplicates std::cout/std::cerr output to a log file.
//
// Batch runs over large replay archives scroll far past a terminal; the log
// keeps a timestamped copy of every per-file result and error.
//
//  - A custom std::streambuf forwards writes to the console streambuf and to
//    the file streambuf.
//  - Simple rotation: <log> -> <log>.1 -> <log>.2 ... up to keepFiles.

struct LogTeeOptions {
  std::filesystem::path path;

  // Rotated backups to keep (>=0). 0 truncates the existing file.
  int keepFiles = 3;

  bool teeStdout = true;
  bool teeStderr = true;

  // Prefix each log file line with a UTC timestamp and a stream tag:
  //   2026-01-27T16:40:12.345Z [ERR] game.avf: FormatError::Truncated: ...
  // Console output is not affected.
  bool prefixLines = true;
};

class LogTee {
public:
  LogTee();
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Start logging. If already active, it is stopped first.
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restore the original std::cout/std::cerr streambufs.
  void stop();

  bool active() const;
  const std::filesystem::path& path() const;

  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace avfcomp
