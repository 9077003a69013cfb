// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAMEHUB_BOARD_COORD_HPP
#define GAMEHUB_BOARD_COORD_HPP

#include <ostream>

namespace gamehub
{

/**
 * A (row, column) pair on some grid.  The coordinate itself does not know
 * the grid size; whether it is inside is decided by the Board it is used
 * with.  Rows grow downwards, columns to the right.
 */
class Coord
{

private:

  int row = 0;
  int column = 0;

public:

  Coord () = default;
  Coord (const Coord&) = default;
  Coord& operator= (const Coord&) = default;

  explicit Coord (const int r, const int c)
    : row(r), column(c)
  {}

  int
  GetRow () const
  {
    return row;
  }

  int
  GetColumn () const
  {
    return column;
  }

  /**
   * Returns the coordinate shifted by the given row and column offsets.
   */
  Coord
  Offset (const int dr, const int dc) const
  {
    return Coord (row + dr, column + dc);
  }

  friend bool
  operator== (const Coord& a, const Coord& b)
  {
    return a.row == b.row && a.column == b.column;
  }

  friend bool
  operator!= (const Coord& a, const Coord& b)
  {
    return !(a == b);
  }

  /** Row-major ordering, so coordinates can be used as map keys.  */
  friend bool
  operator< (const Coord& a, const Coord& b)
  {
    if (a.row != b.row)
      return a.row < b.row;
    return a.column < b.column;
  }

  friend std::ostream&
  operator<< (std::ostream& out, const Coord& c)
  {
    return out << "(" << c.row << ", " << c.column << ")";
  }

};

} // namespace gamehub

#endif // GAMEHUB_BOARD_COORD_HPP
