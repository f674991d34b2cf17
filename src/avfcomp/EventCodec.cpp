#include "avfcomp/EventCodec.hpp"

#include "avfcomp/OpcodeTables.hpp"
#include "avfcomp/Varint.hpp"

#include <cstring>
#include <limits>
#include <string>
#include <utility>

namespace avfcomp {

namespace {

// Zigzag-mapped coordinate delta. Computed in 64 bits so records built by hand
// with extreme coordinates are reported instead of overflowing.
bool CoordinateDelta(std::int32_t cur, std::int32_t prev, const char* axis, std::size_t index, std::uint32_t& out,
                     CodecError& outError)
{
  const std::int64_t d = static_cast<std::int64_t>(cur) - static_cast<std::int64_t>(prev);
  const std::int64_t half = static_cast<std::int64_t>(kVarintLimit / 2u);
  if (d < -half || d >= half) {
    return Fail(outError, ErrorCode::ValueTooLarge,
                "event " + std::to_string(index) + " " + axis + " delta " + std::to_string(d) + " is too large");
  }
  out = ZigZagEncode(static_cast<std::int32_t>(d));
  return true;
}

} // namespace

bool EncodeEventBlock(const std::vector<MouseEvent>& events, std::vector<std::uint8_t>& outPayload,
                      CodecError& outError, EventBlockStats* outStats)
{
  outPayload.clear();

  const std::size_t n = events.size();
  std::vector<std::uint8_t> ops;
  ops.reserve(n);

  // Residual streams, kept separate so they concatenate as t_r ++ x_r ++ y_r.
  std::vector<std::uint32_t> residuals;
  std::vector<std::uint32_t> xr;
  std::vector<std::uint32_t> yr;

  std::int64_t prevT = 0;
  std::int32_t prevX = 0;
  std::int32_t prevY = 0;

  for (std::size_t i = 0; i < n; ++i) {
    const MouseEvent& e = events[i];
    const std::uint8_t raw = static_cast<std::uint8_t>(e.type);
    if (!IsKnownMouseEventType(raw)) {
      return Fail(outError, ErrorCode::UnknownEventType,
                  "event " + std::to_string(i) + " has unknown mouse code " + std::to_string(raw));
    }

    const std::int64_t t = static_cast<std::int64_t>(e.gametime / 10u);
    const std::int64_t dt = t - prevT;
    if (dt < 0) {
      return Fail(outError, ErrorCode::ValueTooLarge,
                  "event " + std::to_string(i) + " goes back in time (dt=" + std::to_string(dt) + ")");
    }
    if (dt >= static_cast<std::int64_t>(kVarintLimit)) {
      return Fail(outError, ErrorCode::ValueTooLarge,
                  "event " + std::to_string(i) + " time delta " + std::to_string(dt) + " is too large");
    }

    std::uint32_t dx = 0;
    std::uint32_t dy = 0;
    if (!CoordinateDelta(e.xpos, prevX, "x", i, dx, outError)) return false;
    if (!CoordinateDelta(e.ypos, prevY, "y", i, dy, outError)) return false;
    prevT = t;
    prevX = e.xpos;
    prevY = e.ypos;

    std::uint8_t code = 0;
    if (EncodeCompoundVector(raw, static_cast<std::uint32_t>(dt), dx, dy, code)) {
      ops.push_back(code);
      continue;
    }

    if (!EncodeBaseOpcode(raw, code)) {
      return Fail(outError, ErrorCode::UnknownEventType,
                  "mouse code " + std::to_string(raw) + " has no base opcode");
    }
    ops.push_back(code);
    residuals.push_back(static_cast<std::uint32_t>(dt));
    xr.push_back(dx);
    yr.push_back(dy);
  }

  const std::size_t triples = residuals.size();
  residuals.insert(residuals.end(), xr.begin(), xr.end());
  residuals.insert(residuals.end(), yr.begin(), yr.end());

  outPayload = std::move(ops);
  outPayload.push_back(kOpcodeSentinel);
  if (!EncodeVarints(residuals, outPayload, outError)) {
    outPayload.clear();
    return false;
  }

  if (outStats) {
    outStats->events = n;
    outStats->compoundHits = n - triples;
    outStats->residualTriples = triples;
    outStats->payloadBytes = outPayload.size();
  }
  return true;
}

bool DecodeEventBlock(const std::uint8_t* payload, std::size_t size, std::vector<MouseEvent>& outEvents,
                      CodecError& outError, EventBlockStats* outStats)
{
  outEvents.clear();

  const void* hit = payload ? std::memchr(payload, kOpcodeSentinel, size) : nullptr;
  if (!hit) {
    return Fail(outError, ErrorCode::TruncatedBlock, "event block has no end-of-opcodes marker");
  }
  const std::size_t n = static_cast<std::size_t>(static_cast<const std::uint8_t*>(hit) - payload);

  std::vector<std::uint32_t> residuals;
  if (!DecodeVarints(payload + n + 1, size - n - 1, residuals, outError)) return false;
  if (residuals.size() % 3u != 0u) {
    return Fail(outError, ErrorCode::TruncatedBlock,
                "residual stream holds " + std::to_string(residuals.size()) + " values, not a multiple of 3");
  }
  const std::size_t triples = residuals.size() / 3u;
  const std::uint32_t* tr = residuals.data();
  const std::uint32_t* xr = tr + triples;
  const std::uint32_t* yr = xr + triples;

  outEvents.reserve(n);

  std::uint64_t t = 0;
  std::int64_t x = 0;
  std::int64_t y = 0;
  std::size_t next = 0;

  for (std::size_t i = 0; i < n; ++i) {
    const std::uint8_t code = payload[i];

    std::uint8_t raw = 0;
    std::uint32_t dt = 0;
    std::uint32_t dx = 0;
    std::uint32_t dy = 0;

    switch (ClassifyOpcode(code)) {
    case OpcodeKind::Compound: {
      CompoundVector v;
      (void)DecodeCompoundVector(code, v);
      raw = v.op;
      dt = v.dt;
      dx = v.dx;
      dy = v.dy;
      break;
    }
    case OpcodeKind::Base:
      (void)DecodeBaseOpcode(code, raw);
      if (next >= triples) {
        return Fail(outError, ErrorCode::TruncatedBlock,
                    "event " + std::to_string(i) + " needs a residual triple but only " + std::to_string(triples) +
                        " are stored");
      }
      dt = tr[next];
      dx = xr[next];
      dy = yr[next];
      ++next;
      break;
    case OpcodeKind::Sentinel:
    case OpcodeKind::Unknown:
      return Fail(outError, ErrorCode::UnknownOpcode,
                  "opcode " + std::to_string(code) + " at event " + std::to_string(i) + " is in neither table");
    }

    t += dt;
    x += ZigZagDecode(dx);
    y += ZigZagDecode(dy);

    if (t * 10u > std::numeric_limits<std::uint32_t>::max() || x < std::numeric_limits<std::int32_t>::min() ||
        x > std::numeric_limits<std::int32_t>::max() || y < std::numeric_limits<std::int32_t>::min() ||
        y > std::numeric_limits<std::int32_t>::max()) {
      return Fail(outError, ErrorCode::TruncatedBlock, "event " + std::to_string(i) + " decodes out of range");
    }

    MouseEvent e;
    e.type = static_cast<MouseEventType>(raw);
    e.gametime = static_cast<std::uint32_t>(t * 10u);
    e.xpos = static_cast<std::int32_t>(x);
    e.ypos = static_cast<std::int32_t>(y);
    outEvents.push_back(e);
  }

  if (next != triples) {
    return Fail(outError, ErrorCode::TruncatedBlock,
                std::to_string(triples - next) + " residual triples are not referenced by any opcode");
  }

  if (outStats) {
    outStats->events = n;
    outStats->compoundHits = n - triples;
    outStats->residualTriples = triples;
    outStats->payloadBytes = size;
  }
  return true;
}

bool WriteEventBlock(const std::vector<MouseEvent>& events, std::vector<std::uint8_t>& out, CodecError& outError,
                     EventBlockStats* outStats)
{
  std::vector<std::uint8_t> payload;
  if (!EncodeEventBlock(events, payload, outError, outStats)) return false;
  if (payload.size() > kMaxEventBlockSize) {
    return Fail(outError, ErrorCode::ValueTooLarge,
                "event block of " + std::to_string(payload.size()) + " bytes exceeds the 3-byte length field");
  }

  AppendU24BE(out, static_cast<std::uint32_t>(payload.size()));
  AppendBytes(out, payload);
  return true;
}

bool ReadEventBlock(ByteReader& in, std::vector<MouseEvent>& outEvents, CodecError& outError,
                    EventBlockStats* outStats)
{
  std::uint32_t len = 0;
  if (!in.readU24BE(len, outError, "event block length")) return false;
  if (in.remaining() < len) return in.truncated(outError, "event block");

  const std::uint8_t* payload = in.data() + in.position();
  if (!DecodeEventBlock(payload, len, outEvents, outError, outStats)) return false;
  return in.skip(len, outError, "event block");
}

} // namespace avfcomp
