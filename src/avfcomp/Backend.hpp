#pragma once

#include "avfcomp/Errors.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace avfcomp {

// Outer byte-stream compression around a CVF image.
//
// The CVF layout itself only removes redundancy that a general-purpose
// compressor cannot see (dictionary/delta coding of events, the mine bitmap).
// A backend then squeezes the rest. Plain, gzip, bzip2 and xz streams are the
// ones other CVF tools write; SLLZ is our own dependency-free codec.
enum class Backend : std::uint8_t {
  Plain = 0,
  Gzip = 1,
  Bzip2 = 2,
  Lzma = 3,
  Sllz = 4,
  // Read side only: pick by magic bytes.
  Auto = 255,
};

const char* BackendName(Backend b);
bool ParseBackend(const std::string& name, Backend& out);

// Detect the backend of a wrapped image by magic bytes: gzip (1F 8B),
// bzip2 ("BZh"), xz (FD 37 7A 58 5A 00), SLLZ ("SLZ1"), else plain.
Backend DetectBackend(const std::uint8_t* data, std::size_t size);

struct BackendOptions {
  Backend backend = Backend::Lzma;
  // 0..9, or -1 for the backend's default (gzip 9, bzip2 9, xz preset 6).
  // bzip2 has no level 0 and uses 1 instead. SLLZ ignores it.
  int level = -1;
};

bool WrapBytes(const std::vector<std::uint8_t>& raw, const BackendOptions& opt, std::vector<std::uint8_t>& out,
               CodecError& outError);

// `backend` may be Auto.
bool UnwrapBytes(const std::vector<std::uint8_t>& wrapped, Backend backend, std::vector<std::uint8_t>& out,
                 CodecError& outError);

} // namespace avfcomp
