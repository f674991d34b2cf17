#pragma once

#include "avfcomp/Errors.hpp"
#include "avfcomp/EventCodec.hpp"
#include "avfcomp/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <vector>

namespace avfcomp {

// CVF: the compact container, before any backend compression.
//
//   header            version(1) prefix(4) level(1) [cols-1(1) rows-1(1) mines(2, BE) when level == 6]
//   mine bitmap       ceil(rows*cols/8) bytes (see MineField.hpp)
//   prestamp '[' tsInfo ']'
//   preevent
//   0x00 0x01         event block marker
//   event block       3-byte BE length + payload (see EventCodec.hpp)
//   presuffix         verbatim, starting with the AVF sentinel record
//   footer            skin '\r' player id '\r' arbiter version
//
// The reader locates the event block with the same heuristic scan that the
// AVF parser uses, which stops on the 0x00 0x01 marker.

bool WriteCvf(const ReplayRecord& record, std::vector<std::uint8_t>& out, CodecError& outError,
              EventBlockStats* outStats = nullptr);

bool ReadCvf(const std::uint8_t* data, std::size_t size, ReplayRecord& outRecord, CodecError& outError,
             EventBlockStats* outStats = nullptr);
bool ReadCvf(const std::vector<std::uint8_t>& bytes, ReplayRecord& outRecord, CodecError& outError,
             EventBlockStats* outStats = nullptr);

// Unwrapped CVF images only; backends live in Backend.hpp.
bool WriteCvf(const ReplayRecord& record, std::ostream& out, CodecError& outError);
bool ReadCvf(std::istream& in, ReplayRecord& outRecord, CodecError& outError);

} // namespace avfcomp
