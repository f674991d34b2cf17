#pragma once

#include "avfcomp/Backend.hpp"
#include "avfcomp/Errors.hpp"
#include "avfcomp/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace avfcomp {

// High-level AVF <-> CVF pipeline:
//
//   compress:   AVF bytes -> ParseAvf -> WriteCvf -> backend wrap
//   decompress: backend unwrap -> ReadCvf -> WriteAvf -> AVF bytes

struct CodecOptions {
  BackendOptions backend;

  // Read side only. Auto sniffs the wrapped image.
  Backend readBackend = Backend::Auto;

  // After compressing, decode the result again and require the exact input
  // bytes back (RoundTripMismatch otherwise).
  bool verify = true;
};

struct CodecStats {
  std::size_t inputBytes = 0;
  std::size_t cvfBytes = 0;    // CVF image before the backend
  std::size_t outputBytes = 0;
  std::size_t events = 0;
  std::size_t compoundHits = 0;
  std::size_t residualTriples = 0;
  double seconds = 0.0;

  // output/input; 0 when the input is empty.
  double ratio() const;

  void accumulate(const CodecStats& o);
};

bool CompressAvfBytes(const std::vector<std::uint8_t>& avf, const CodecOptions& opt, std::vector<std::uint8_t>& outCvf,
                      CodecError& outError, CodecStats* stats = nullptr);

bool DecompressCvfBytes(const std::vector<std::uint8_t>& cvf, const CodecOptions& opt,
                        std::vector<std::uint8_t>& outAvf, CodecError& outError, CodecStats* stats = nullptr);

// Unwrap + ReadCvf only, for inspection.
bool LoadCvfRecord(const std::vector<std::uint8_t>& cvf, Backend backend, ReplayRecord& outRecord,
                   CodecError& outError);

// File front ends. The destination is written atomically; on failure it is
// left untouched.
bool CompressFile(const std::filesystem::path& inPath, const std::filesystem::path& outPath, const CodecOptions& opt,
                  CodecError& outError, CodecStats* stats = nullptr);

bool DecompressFile(const std::filesystem::path& inPath, const std::filesystem::path& outPath,
                    const CodecOptions& opt, CodecError& outError, CodecStats* stats = nullptr);

} // namespace avfcomp
