#pragma once

#include "avfcomp/Errors.hpp"
#include "avfcomp/Types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace avfcomp {

// Text footer at the end of an AVF file. Fields are separated by '\r':
//
//   RealTime: <seconds><last 3 chars of the info block's final field>
//   Skin: <skin>
//   <player id>
//   Minesweeper Arbiter <version>. Copyright \xA9 2005-2006 Dmitriy I. Sukhomlynov
//
// RealTime is derived from the last event and the info block, so only the
// skin, player id and arbiter version are stored. CVF keeps those three,
// '\r'-joined.

// Extract skin / player id / arbiter version from the raw AVF footer bytes.
bool ParseAvfFooter(const std::vector<std::uint8_t>& raw, ReplayFooter& out, CodecError& outError);

// The derived RealTime value (without the "RealTime: " label).
// Fails with MalformedFooter when the record has no events.
bool ComputeRealTime(const ReplayRecord& record, std::string& out, CodecError& outError);

// Rebuild the full AVF footer, RealTime included.
bool AppendAvfFooter(const ReplayRecord& record, std::vector<std::uint8_t>& out, CodecError& outError);

void AppendCvfFooter(const ReplayFooter& footer, std::vector<std::uint8_t>& out);
bool ParseCvfFooter(const std::vector<std::uint8_t>& raw, ReplayFooter& out, CodecError& outError);

} // namespace avfcomp
