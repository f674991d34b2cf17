#pragma once

#include "avfcomp/ByteCursor.hpp"
#include "avfcomp/Errors.hpp"
#include "avfcomp/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace avfcomp {

// CVF event block.
//
// Payload layout:
//   opcode run          one byte per event (compound code 0..240 or base code 241..251)
//   0xFF                end of the opcode run
//   residual varints    t_r ++ x_r ++ y_r for every event that used a base code
//
// On disk the payload is preceded by its length as a 3-byte big-endian integer.
//
// Per event, before the dictionary lookup:
//   dt = gametime/10 - previous gametime/10      (first event: absolute)
//   dx = zigzag(xpos - previous xpos)            (first event: zigzag(xpos))
//   dy = zigzag(ypos - previous ypos)
//
// Timestamps are stored in deciseconds; the millisecond remainder is dropped.

inline constexpr std::uint32_t kMaxEventBlockSize = 0xFFFFFFu;

struct EventBlockStats {
  std::size_t events = 0;
  std::size_t compoundHits = 0;
  std::size_t residualTriples = 0;
  std::size_t payloadBytes = 0;
};

bool EncodeEventBlock(const std::vector<MouseEvent>& events, std::vector<std::uint8_t>& outPayload,
                      CodecError& outError, EventBlockStats* outStats = nullptr);

bool DecodeEventBlock(const std::uint8_t* payload, std::size_t size, std::vector<MouseEvent>& outEvents,
                      CodecError& outError, EventBlockStats* outStats = nullptr);

// Length-prefixed helpers used by the CVF writer/reader.
bool WriteEventBlock(const std::vector<MouseEvent>& events, std::vector<std::uint8_t>& out, CodecError& outError,
                     EventBlockStats* outStats = nullptr);

bool ReadEventBlock(ByteReader& in, std::vector<MouseEvent>& outEvents, CodecError& outError,
                    EventBlockStats* outStats = nullptr);

} // namespace avfcomp
