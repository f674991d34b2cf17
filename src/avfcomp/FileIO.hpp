#pragma once

#include "avfcomp/Errors.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace avfcomp {

// Whole-file helpers for the codec front ends.
//
// Replays are small (tens of KiB), so the codec works on complete in-memory
// images. Outputs are written with a temp-file + rename pattern:
//   1) write <out>.tmp
//   2) fsync(<out>.tmp)
//   3) rename(<out>.tmp -> <out>)
//   4) fsync(parent directory), best-effort
// so a failed or interrupted run never leaves a partial file at <out>.

bool ReadFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>& out, CodecError& outError);

// Stream adapters for callers that already hold an open stream.
bool ReadStreamBytes(std::istream& in, std::vector<std::uint8_t>& out, CodecError& outError);
bool WriteStreamBytes(std::ostream& out, const std::vector<std::uint8_t>& data, CodecError& outError);

bool WriteFileAtomic(const std::filesystem::path& path, const std::vector<std::uint8_t>& data,
                     CodecError& outError);

// Flush file contents/metadata to stable storage.
bool SyncFile(const std::filesystem::path& path, std::string& outError);

// Some filesystems do not support syncing directories; callers treat a false
// return as advisory.
bool SyncDirectory(const std::filesystem::path& dir, std::string& outError);

} // namespace avfcomp
