// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "board.hpp"

#include <glog/logging.h>

namespace gamehub
{

Board::Board (const int r, const int c)
  : rows(r), columns(c)
{
  CHECK_GT (rows, 0) << "Board needs a positive number of rows";
  CHECK_GT (columns, 0) << "Board needs a positive number of columns";
}

Board
Board::Create8x8 ()
{
  return Board (8, 8);
}

bool
Board::IsInside (const int row, const int col) const
{
  if (row < 0 || row >= rows)
    return false;
  if (col < 0 || col >= columns)
    return false;

  return true;
}

int
Board::ToIndex (const int row, const int col) const
{
  CHECK (IsInside (row, col))
      << "Cell " << Coord (row, col) << " is outside the board";

  return row * columns + col;
}

Coord
Board::FromIndex (const int index) const
{
  CHECK (index >= 0 && index < GetCellCount ())
      << "Index " << index << " is outside the board";

  return Coord (index / columns, index % columns);
}

bool
Board::IsDarkSquare (const int row, const int col) const
{
  CHECK (IsInside (row, col))
      << "Cell " << Coord (row, col) << " is outside the board";

  return (row + col) % 2 == 1;
}

} // namespace gamehub
