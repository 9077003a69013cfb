// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAMEHUB_CHECKERS_STATE_HPP
#define GAMEHUB_CHECKERS_STATE_HPP

#include <board/board.hpp>
#include <hubutil/random.hpp>
#include <rooms/roomstate.hpp>

#include <array>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace checkers
{

using gamehub::Coord;
using gamehub::PlayerId;

/** Content of a square.  */
enum class Piece
{
  EMPTY = 0,
  RED_MAN,
  RED_KING,
  BLACK_MAN,
  BLACK_KING,
};

enum class Side
{
  RED,
  BLACK,
};

/** Lifecycle of a checkers room.  */
enum class Phase
{
  NOT_STARTED,
  ACTIVE,
  GAME_OVER,
};

Side Opponent (Side s);

/**
 * Returns true if the piece is a man or king of the given side.
 */
bool BelongsTo (Piece p, Side s);

bool IsKing (Piece p);

/**
 * The origin and destination of the most recent accepted move.
 */
struct LastMove
{
  Coord from;
  Coord to;
};

/**
 * Session state of a checkers room.
 *
 * Black starts on rows 0-2 and moves towards increasing rows, Red starts
 * on rows 5-7 and moves towards row 0.  Men move and capture forward
 * only, kings along all four diagonals.  Capturing is mandatory, and a
 * piece that can capture again after a capture has to continue (the turn
 * does not pass until its chain ends).  A man reaching the far row is
 * promoted immediately, also in the middle of a chain.
 *
 * The game starts as soon as a second distinct player joins.  Sides and
 * the starting player are then decided by the injected policies, both of
 * which default to a uniform random choice from the room's Random.
 */
class CheckersRoomState : public gamehub::RoomState
{

public:

  /** Side length of the board.  */
  static constexpr int SIZE = 8;

  /**
   * Policy that decides the sides when the game starts.  It returns true
   * if the first joiner plays red.
   */
  using SideAssignmentPolicy = std::function<bool (gamehub::Random&)>;

  /** Policy that picks the side that makes the first move.  */
  using FirstTurnPolicy = std::function<Side (gamehub::Random&)>;

  static bool RandomSides (gamehub::Random& rnd);
  static Side RandomStarter (gamehub::Random& rnd);

private:

  const gamehub::Board board;

  /** Pieces in row-major order.  */
  std::array<Piece, SIZE * SIZE> pieces;

  gamehub::Random rnd;
  SideAssignmentPolicy sideAssignment;
  FirstTurnPolicy firstTurn;

  /** The players in the room, in join order.  At most two.  */
  std::vector<PlayerId> joiners;

  PlayerId redPlayer;
  PlayerId blackPlayer;

  Phase phase = Phase::NOT_STARTED;

  /** Player to move.  Empty unless the game is active.  */
  PlayerId currentPlayer;

  /** The winner after game over.  Empty for a game without winner.  */
  PlayerId winner;

  /**
   * If set, the square of the piece that is in the middle of a capture
   * chain.  The next move must start from there.
   */
  std::optional<Coord> forced;

  std::optional<LastMove> lastMove;

  unsigned moveNumber = 0;

  Piece&
  At (const Coord& c)
  {
    return pieces[board.ToIndex (c)];
  }

  /**
   * Returns the row direction in which men of the given side move.
   */
  static int ForwardDirection (Side s);

  /**
   * Returns true if the piece at the given square has a simple
   * (non-capturing) move available.
   */
  bool HasSimpleMoveFrom (const Coord& c) const;

  /**
   * Returns true if the piece at the given square can capture.
   */
  bool HasCaptureFrom (const Coord& c) const;

  /**
   * Sets up the starting layout, applies the side and first-turn policies
   * and marks the game as active.  Requires two joiners.
   */
  void Start ();

  /**
   * Ends the game with the given winner (may be empty).
   */
  void FinishGame (const PlayerId& w);

  /**
   * Checks for the end of the game after a move has been applied.
   */
  void UpdateGameOver ();

  friend class CheckersTests;

public:

  explicit CheckersRoomState (const std::string& code, gamehub::Random&& r,
                              SideAssignmentPolicy sides = &RandomSides,
                              FirstTurnPolicy ft = &RandomStarter);

  CheckersRoomState (CheckersRoomState&&) = default;

  /**
   * Adds the player to the room.  Joining twice is a no-op.  Returns false
   * if two other players are already present.  When this brings the room
   * to two players, a new game starts.
   */
  bool Join (const PlayerId& id);

  /**
   * Handles a player leaving the room.  Before the game started, this
   * simply frees the slot.  Leaving an active game forfeits it.
   */
  void PlayerLeft (const PlayerId& id);

  /**
   * Tries to move the piece at "from" to "to" for the given player.
   * Returns false and leaves the state unchanged if the move is not legal.
   */
  bool ApplyMove (const PlayerId& id, const Coord& from, const Coord& to);

  /**
   * The given player gives up; the opponent wins.  Returns false if the
   * game is not active or the player has no side.
   */
  bool Resign (const PlayerId& id);

  /**
   * Starts a fresh game with the same two players.  Sides and starter
   * are decided again by the policies.  Returns false if there are not
   * two players in the room.
   */
  bool Restart ();

  /**
   * Looks up the side of a player.  Returns false if the player is not
   * bound to a side.
   */
  bool GetSideOf (const PlayerId& id, Side& side) const;

  Piece GetPiece (const Coord& c) const;

  /**
   * Returns the number of pieces (men and kings) of the given side.
   */
  unsigned CountPieces (Side s) const;

  /**
   * Returns true if any piece of the side can capture.
   */
  bool HasAnyCapture (Side s) const;

  /**
   * Returns true if the side has any legal move at all.
   */
  bool HasAnyMove (Side s) const;

  const gamehub::Board&
  GetBoard () const
  {
    return board;
  }

  const std::vector<PlayerId>&
  GetJoiners () const
  {
    return joiners;
  }

  const PlayerId&
  GetRedPlayer () const
  {
    return redPlayer;
  }

  const PlayerId&
  GetBlackPlayer () const
  {
    return blackPlayer;
  }

  Phase
  GetPhase () const
  {
    return phase;
  }

  bool
  IsStarted () const
  {
    return phase != Phase::NOT_STARTED;
  }

  bool
  IsGameOver () const
  {
    return phase == Phase::GAME_OVER;
  }

  const PlayerId&
  GetCurrentPlayer () const
  {
    return currentPlayer;
  }

  const PlayerId&
  GetWinner () const
  {
    return winner;
  }

  const std::optional<Coord>&
  GetForced () const
  {
    return forced;
  }

  const std::optional<LastMove>&
  GetLastMove () const
  {
    return lastMove;
  }

  unsigned
  GetMoveNumber () const
  {
    return moveNumber;
  }

  std::string GetStatusMessage () const;

  /**
   * Renders the board as eight lines of ".", "r", "R", "b" and "B".
   */
  std::string BoardToString () const;

};

} // namespace checkers

#endif // GAMEHUB_CHECKERS_STATE_HPP
