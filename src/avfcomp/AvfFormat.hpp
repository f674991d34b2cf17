#pragma once

#include "avfcomp/Errors.hpp"
#include "avfcomp/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <vector>

namespace avfcomp {

// AVF: the uncompressed replay format.
//
// Layout (big-endian):
//   header            version(1) prefix(4) level(1) [custom dims]
//   mines             mineCount x (row(1), col(1))
//   prestamp          free-form bytes up to '['
//   '[' tsInfo ']'
//   preevent          free-form bytes; its end is only found heuristically
//   events            8-byte records until a record whose seconds field is 0
//   presuffix         sentinel record, 2 bytes, bytes through "cs=", 17 bytes
//   footer            '\r'-separated text (see Footer.hpp)
//
// Event record:
//   mouse, x_hi, sec_lo, x_lo, hundredths, y_hi, sec_hi, y_lo
// with sec stored +1 (a stored 0 marks the sentinel).

inline constexpr std::size_t kAvfEventRecordSize = 8;

// Parse a complete AVF image.
bool ParseAvf(const std::uint8_t* data, std::size_t size, ReplayRecord& outRecord, CodecError& outError);
bool ParseAvf(const std::vector<std::uint8_t>& bytes, ReplayRecord& outRecord, CodecError& outError);
// Reads the stream to its end.
bool ParseAvf(std::istream& in, ReplayRecord& outRecord, CodecError& outError);

// Serialize a record back to AVF. `out` is only appended to on success.
bool WriteAvf(const ReplayRecord& record, std::vector<std::uint8_t>& out, CodecError& outError);
bool WriteAvf(const ReplayRecord& record, std::ostream& out, CodecError& outError);

// Single-event helpers (exposed for tests).
void EncodeAvfEvent(const MouseEvent& e, std::uint8_t out[kAvfEventRecordSize]);
bool IsAvfSentinelRecord(const std::uint8_t rec[kAvfEventRecordSize]);

} // namespace avfcomp
