// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAMEHUB_TICTACTOE_STATE_HPP
#define GAMEHUB_TICTACTOE_STATE_HPP

#include <board/board.hpp>
#include <hubutil/random.hpp>
#include <rooms/roomstate.hpp>

#include <array>
#include <functional>
#include <string>

namespace tictactoe
{

using gamehub::PlayerId;

/** The content of a cell, and at the same time the two sides.  */
enum class Mark
{
  NONE = 0,
  X = 1,
  O = 2,
};

/**
 * Returns the other mark.  Must not be called with NONE.
 */
Mark Opponent (Mark m);

/**
 * Session state of a tic-tac-toe room.  The first player seated takes X
 * (the host), the second O.  Once both are seated, a first-turn policy
 * picks who starts; after that, turns alternate until three in a row or a
 * full board ends the game.
 */
class TicTacToeRoomState : public gamehub::RoomState
{

public:

  /** Number of cells on the board.  */
  static constexpr int CELLS = 9;

  /**
   * Policy deciding which mark moves first once both players are seated.
   * It may draw from the room's random stream.
   */
  using FirstTurnPolicy = std::function<Mark (gamehub::Random&)>;

  /** The default policy:  X (the host) starts.  */
  static Mark HostStarts (gamehub::Random& rnd);

  /** Policy that picks the starter uniformly at random.  */
  static Mark RandomStarter (gamehub::Random& rnd);

private:

  /** The 3x3 coordinate space.  */
  const gamehub::Board board;

  /** The cells in row-major order.  */
  std::array<Mark, CELLS> cells;

  /** Random stream for the first-turn policy.  */
  gamehub::Random rnd;

  FirstTurnPolicy firstTurn;

  PlayerId playerX;
  PlayerId playerO;

  /** Whose turn it is.  Before O is seated, this is the host.  */
  PlayerId currentPlayer;

  bool gameOver = false;
  PlayerId winner;
  bool draw = false;

  /** Number of marks placed since the last (re)start.  */
  unsigned moveCount = 0;

  /**
   * Returns true if the given mark has three in a row on any line.
   */
  bool HasLine (Mark m) const;

  /**
   * Returns true if no cell is empty.
   */
  bool IsFull () const;

  /**
   * Returns the player bound to the given mark.
   */
  const PlayerId& GetPlayer (Mark m) const;

  /**
   * Applies the first-turn policy.  Both marks must be bound.
   */
  void ChooseStarter ();

public:

  explicit TicTacToeRoomState (const std::string& code, gamehub::Random&& r,
                               FirstTurnPolicy ft = &HostStarts);

  TicTacToeRoomState (TicTacToeRoomState&&) = default;

  /**
   * Seats the player.  The first player takes X, the second O.  If the
   * player is already seated, the existing mark is returned.  Returns false
   * if both marks are taken by others.
   */
  bool SeatPlayer (const PlayerId& id, Mark& mark);

  /**
   * Releases the player's mark.  This is only possible before the first
   * move of a game; returns false otherwise or if the player is not seated.
   */
  bool UnseatPlayer (const PlayerId& id);

  /**
   * Places the acting player's mark at the given cell index (0..8).
   * Returns false and leaves the state unchanged if the game is not ready
   * or already over, if it is not the player's turn, or if the cell is
   * out of range or occupied.
   */
  bool ApplyMove (const PlayerId& id, int index);

  /**
   * Same as ApplyMove with an index, but by (row, col).
   */
  bool ApplyMove (const PlayerId& id, int row, int col);

  /**
   * Clears the board and outcome, keeps both players and picks the starter
   * again.
   */
  void Restart ();

  /**
   * Returns true if both marks are bound, so that moves can be made.
   */
  bool
  IsReady () const
  {
    return !playerX.empty () && !playerO.empty ();
  }

  /**
   * Returns the mark of the given player, or NONE.
   */
  Mark GetMarkOf (const PlayerId& id) const;

  const std::array<Mark, CELLS>&
  GetCells () const
  {
    return cells;
  }

  const PlayerId&
  GetPlayerX () const
  {
    return playerX;
  }

  const PlayerId&
  GetPlayerO () const
  {
    return playerO;
  }

  const PlayerId&
  GetCurrentPlayer () const
  {
    return currentPlayer;
  }

  bool
  IsGameOver () const
  {
    return gameOver;
  }

  const PlayerId&
  GetWinner () const
  {
    return winner;
  }

  bool
  IsDraw () const
  {
    return draw;
  }

  unsigned
  GetMoveCount () const
  {
    return moveCount;
  }

  /**
   * Returns a human-readable status line for the frontends.
   */
  std::string GetStatusMessage () const;

};

} // namespace tictactoe

#endif // GAMEHUB_TICTACTOE_STATE_HPP
