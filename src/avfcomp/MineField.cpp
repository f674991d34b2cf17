#include "avfcomp/MineField.hpp"

#include <string>

namespace avfcomp {

bool EncodeMineBitmap(const std::vector<MinePos>& mines, int rows, int cols, std::vector<std::uint8_t>& out,
                      CodecError& outError)
{
  const std::size_t start = out.size();
  out.resize(start + MineBitmapSize(rows, cols), 0u);

  for (std::size_t i = 0; i < mines.size(); ++i) {
    const int row = mines[i].first;
    const int col = mines[i].second;
    if (row < 1 || row > rows || col < 1 || col > cols) {
      out.resize(start);
      return Fail(outError, ErrorCode::InvalidLevel,
                  "mine (" + std::to_string(row) + ", " + std::to_string(col) + ") lies outside the " +
                      std::to_string(cols) + "x" + std::to_string(rows) + " board");
    }
    if (i > 0) {
      const MinePos& prev = mines[i - 1];
      if (col < prev.second || (col == prev.second && row <= prev.first)) {
        out.resize(start);
        return Fail(outError, ErrorCode::InvalidLevel,
                    "mine " + std::to_string(i) + " (" + std::to_string(row) + ", " + std::to_string(col) +
                        ") breaks the column-by-column order the bitmap restores");
      }
    }

    const std::size_t idx = static_cast<std::size_t>(row - 1) * static_cast<std::size_t>(cols) +
                            static_cast<std::size_t>(col - 1);
    out[start + idx / 8u] |= static_cast<std::uint8_t>(1u << (7u - idx % 8u));
  }
  return true;
}

void DecodeMineBitmap(const std::uint8_t* bitmap, int rows, int cols, std::vector<MinePos>& outMines)
{
  outMines.clear();
  if (!bitmap) return;

  for (int col = 0; col < cols; ++col) {
    for (int row = 0; row < rows; ++row) {
      const std::size_t idx = static_cast<std::size_t>(row) * static_cast<std::size_t>(cols) +
                              static_cast<std::size_t>(col);
      if ((bitmap[idx / 8u] >> (7u - idx % 8u)) & 1u) {
        outMines.emplace_back(row + 1, col + 1);
      }
    }
  }
}

} // namespace avfcomp
