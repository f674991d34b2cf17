#pragma once

#include "avfcomp/Errors.hpp"
#include "avfcomp/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace avfcomp {

// Sparse mine coordinates <-> dense board bitmap.
//
// Bit layout: cell index idx = (row-1)*cols + (col-1), stored in byte idx/8 at
// bit 7 - idx%8 (MSB first).
//
// Decoding walks columns in the outer loop and rows in the inner loop, so the
// decoded list is ordered by column, then row. That order is what the CVF
// reader hands to the AVF writer and must not change.

inline std::size_t MineBitmapSize(int rows, int cols)
{
  if (rows <= 0 || cols <= 0) return 0;
  return (static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols) + 7u) / 8u;
}

// Mines outside [1,rows] x [1,cols] are rejected with InvalidLevel, and so
// are lists that are not strictly ordered by column, then row (duplicates
// included): the bitmap could not give that list back.
bool EncodeMineBitmap(const std::vector<MinePos>& mines, int rows, int cols, std::vector<std::uint8_t>& out,
                      CodecError& outError);

// `bitmap` must hold MineBitmapSize(rows, cols) bytes.
void DecodeMineBitmap(const std::uint8_t* bitmap, int rows, int cols, std::vector<MinePos>& outMines);

} // namespace avfcomp
