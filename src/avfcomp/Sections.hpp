#pragma once

#include "avfcomp/ByteCursor.hpp"
#include "avfcomp/Errors.hpp"
#include "avfcomp/Types.hpp"

#include <cstdint>
#include <vector>

namespace avfcomp {

// Record sections that AVF and CVF lay out identically.

// version(1) prefix(4) level(1) [cols-1(1) rows-1(1) mines(2, BE) when level == 6]
bool ReadRecordHeader(ByteReader& in, ReplayRecord& record, CodecError& outError);
bool AppendRecordHeader(const ReplayRecord& record, std::vector<std::uint8_t>& out, CodecError& outError);

// prestamp '[' tsInfo ']'
bool ReadInfoBlock(ByteReader& in, ReplayRecord& record, CodecError& outError);
void AppendInfoBlock(const ReplayRecord& record, std::vector<std::uint8_t>& out);

// The bytes after the sentinel record: 2 bytes, a scan through "cs=", then 17
// fixed bytes. Appended to record.presuffix.
bool ReadPresuffixTail(ByteReader& in, ReplayRecord& record, CodecError& outError);

} // namespace avfcomp
