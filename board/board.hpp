// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAMEHUB_BOARD_BOARD_HPP
#define GAMEHUB_BOARD_BOARD_HPP

#include "coord.hpp"

#include <iterator>

namespace gamehub
{

/**
 * A rectangular coordinate space of fixed size, shared by the grid-based
 * games.  It translates between coordinates and linear (row-major)
 * indices and classifies squares into a dark / light pattern.
 *
 * Passing an out-of-board coordinate or index to ToIndex, FromIndex or
 * IsDarkSquare is a programming error; callers that handle untrusted
 * input must check with IsInside first.
 */
class Board
{

private:

  int rows;
  int columns;

public:

  /**
   * Forward iterator over all cells of a board in row-major order.
   */
  class CellIterator
  {

  private:

    const Board* board;
    int index;

  public:

    using iterator_category = std::forward_iterator_tag;
    using value_type = Coord;
    using difference_type = int;
    using pointer = const Coord*;
    using reference = Coord;

    explicit CellIterator (const Board& b, const int i)
      : board(&b), index(i)
    {}

    Coord
    operator* () const
    {
      return board->FromIndex (index);
    }

    CellIterator&
    operator++ ()
    {
      ++index;
      return *this;
    }

    CellIterator
    operator++ (int)
    {
      CellIterator res = *this;
      ++index;
      return res;
    }

    friend bool
    operator== (const CellIterator& a, const CellIterator& b)
    {
      return a.board == b.board && a.index == b.index;
    }

    friend bool
    operator!= (const CellIterator& a, const CellIterator& b)
    {
      return !(a == b);
    }

  };

  /**
   * Lazy range of all cells, as returned by AllCells.  It can be iterated
   * any number of times.
   */
  class CellRange
  {

  private:

    const Board& board;

  public:

    explicit CellRange (const Board& b)
      : board(b)
    {}

    CellIterator
    begin () const
    {
      return CellIterator (board, 0);
    }

    CellIterator
    end () const
    {
      return CellIterator (board, board.GetCellCount ());
    }

  };

  /**
   * Constructs a board of the given size.  Both dimensions must be
   * positive.
   */
  explicit Board (int r, int c);

  Board (const Board&) = default;
  Board& operator= (const Board&) = default;

  /**
   * Returns a standard 8x8 board as used by checkers and chess.
   */
  static Board Create8x8 ();

  int
  GetRows () const
  {
    return rows;
  }

  int
  GetColumns () const
  {
    return columns;
  }

  int
  GetCellCount () const
  {
    return rows * columns;
  }

  bool IsInside (int row, int col) const;

  bool
  IsInside (const Coord& c) const
  {
    return IsInside (c.GetRow (), c.GetColumn ());
  }

  /**
   * Returns the row-major index of the given cell.
   */
  int ToIndex (int row, int col) const;

  int
  ToIndex (const Coord& c) const
  {
    return ToIndex (c.GetRow (), c.GetColumn ());
  }

  /**
   * Converts a row-major index back into a coordinate.  The index must be
   * in [0, GetCellCount ()).
   */
  Coord FromIndex (int index) const;

  /**
   * Returns all cells in row-major order.
   */
  CellRange
  AllCells () const
  {
    return CellRange (*this);
  }

  /**
   * Returns true if the square is "dark" in the alternating pattern, which
   * is the case when (row + col) is odd.  (0, 0) is light.
   */
  bool IsDarkSquare (int row, int col) const;

  bool
  IsDarkSquare (const Coord& c) const
  {
    return IsDarkSquare (c.GetRow (), c.GetColumn ());
  }

};

} // namespace gamehub

#endif // GAMEHUB_BOARD_BOARD_HPP
