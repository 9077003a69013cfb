// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "state.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace checkers
{

namespace
{

/** Diagonal directions as (row, column) offsets.  */
constexpr int DIRECTIONS[][2] =
  {
    {-1, -1}, {-1, 1},
    {1, -1}, {1, 1},
  };

/** Number of rows each side fills at the start.  */
constexpr int STARTING_ROWS = 3;

char
PieceToChar (const Piece p)
{
  switch (p)
    {
    case Piece::EMPTY:
      return '.';
    case Piece::RED_MAN:
      return 'r';
    case Piece::RED_KING:
      return 'R';
    case Piece::BLACK_MAN:
      return 'b';
    case Piece::BLACK_KING:
      return 'B';
    }

  LOG (FATAL) << "Invalid piece: " << static_cast<int> (p);
}

} // anonymous namespace

Side
Opponent (const Side s)
{
  return s == Side::RED ? Side::BLACK : Side::RED;
}

bool
BelongsTo (const Piece p, const Side s)
{
  switch (s)
    {
    case Side::RED:
      return p == Piece::RED_MAN || p == Piece::RED_KING;
    case Side::BLACK:
      return p == Piece::BLACK_MAN || p == Piece::BLACK_KING;
    }

  LOG (FATAL) << "Invalid side: " << static_cast<int> (s);
}

bool
IsKing (const Piece p)
{
  return p == Piece::RED_KING || p == Piece::BLACK_KING;
}

bool
CheckersRoomState::RandomSides (gamehub::Random& rnd)
{
  return rnd.Next<bool> ();
}

Side
CheckersRoomState::RandomStarter (gamehub::Random& rnd)
{
  return rnd.Next<bool> () ? Side::RED : Side::BLACK;
}

CheckersRoomState::CheckersRoomState (const std::string& code,
                                      gamehub::Random&& r,
                                      SideAssignmentPolicy sides,
                                      FirstTurnPolicy ft)
  : RoomState(code), board(gamehub::Board::Create8x8 ()),
    rnd(std::move (r)),
    sideAssignment(std::move (sides)), firstTurn(std::move (ft))
{
  CHECK_EQ (board.GetCellCount (), SIZE * SIZE);
  CHECK (sideAssignment != nullptr);
  CHECK (firstTurn != nullptr);
  pieces.fill (Piece::EMPTY);
}

int
CheckersRoomState::ForwardDirection (const Side s)
{
  return s == Side::RED ? -1 : 1;
}

Piece
CheckersRoomState::GetPiece (const Coord& c) const
{
  return pieces[board.ToIndex (c)];
}

bool
CheckersRoomState::GetSideOf (const PlayerId& id, Side& side) const
{
  if (id.empty ())
    return false;

  if (id == redPlayer)
    {
      side = Side::RED;
      return true;
    }
  if (id == blackPlayer)
    {
      side = Side::BLACK;
      return true;
    }

  return false;
}

unsigned
CheckersRoomState::CountPieces (const Side s) const
{
  return std::count_if (pieces.begin (), pieces.end (),
                        [s] (const Piece p) { return BelongsTo (p, s); });
}

bool
CheckersRoomState::HasSimpleMoveFrom (const Coord& c) const
{
  const Piece p = GetPiece (c);
  CHECK (p != Piece::EMPTY) << "No piece at " << c;
  const Side s = BelongsTo (p, Side::RED) ? Side::RED : Side::BLACK;

  for (const auto& d : DIRECTIONS)
    {
      if (!IsKing (p) && d[0] != ForwardDirection (s))
        continue;

      const Coord target = c.Offset (d[0], d[1]);
      if (board.IsInside (target) && GetPiece (target) == Piece::EMPTY)
        return true;
    }

  return false;
}

bool
CheckersRoomState::HasCaptureFrom (const Coord& c) const
{
  const Piece p = GetPiece (c);
  CHECK (p != Piece::EMPTY) << "No piece at " << c;
  const Side s = BelongsTo (p, Side::RED) ? Side::RED : Side::BLACK;

  for (const auto& d : DIRECTIONS)
    {
      if (!IsKing (p) && d[0] != ForwardDirection (s))
        continue;

      const Coord jumped = c.Offset (d[0], d[1]);
      const Coord target = c.Offset (2 * d[0], 2 * d[1]);
      if (!board.IsInside (target))
        continue;

      if (BelongsTo (GetPiece (jumped), Opponent (s))
            && GetPiece (target) == Piece::EMPTY)
        return true;
    }

  return false;
}

bool
CheckersRoomState::HasAnyCapture (const Side s) const
{
  for (const auto& c : board.AllCells ())
    if (BelongsTo (GetPiece (c), s) && HasCaptureFrom (c))
      return true;

  return false;
}

bool
CheckersRoomState::HasAnyMove (const Side s) const
{
  for (const auto& c : board.AllCells ())
    if (BelongsTo (GetPiece (c), s)
          && (HasSimpleMoveFrom (c) || HasCaptureFrom (c)))
      return true;

  return false;
}

void
CheckersRoomState::Start ()
{
  CHECK_EQ (joiners.size (), 2);

  if (sideAssignment (rnd))
    {
      redPlayer = joiners[0];
      blackPlayer = joiners[1];
    }
  else
    {
      redPlayer = joiners[1];
      blackPlayer = joiners[0];
    }

  pieces.fill (Piece::EMPTY);
  for (const auto& c : board.AllCells ())
    {
      if (!board.IsDarkSquare (c))
        continue;

      if (c.GetRow () < STARTING_ROWS)
        At (c) = Piece::BLACK_MAN;
      else if (c.GetRow () >= SIZE - STARTING_ROWS)
        At (c) = Piece::RED_MAN;
    }

  phase = Phase::ACTIVE;
  winner.clear ();
  forced.reset ();
  lastMove.reset ();
  moveNumber = 0;

  const Side starter = firstTurn (rnd);
  currentPlayer = (starter == Side::RED ? redPlayer : blackPlayer);

  LOG (INFO)
      << "Checkers game started in room " << GetRoomCode ()
      << ": red " << redPlayer << ", black " << blackPlayer
      << ", " << currentPlayer << " moves first";
}

bool
CheckersRoomState::Join (const PlayerId& id)
{
  CHECK (!id.empty ());

  if (std::find (joiners.begin (), joiners.end (), id) != joiners.end ())
    return true;

  if (joiners.size () >= 2)
    {
      LOG (WARNING)
          << "Checkers room " << GetRoomCode () << " is full, rejecting "
          << id;
      return false;
    }

  joiners.push_back (id);
  VLOG (1) << "Player " << id << " joined checkers room " << GetRoomCode ();

  if (joiners.size () == 2)
    Start ();

  return true;
}

void
CheckersRoomState::PlayerLeft (const PlayerId& id)
{
  auto mit = std::find (joiners.begin (), joiners.end (), id);
  if (mit == joiners.end ())
    return;
  joiners.erase (mit);

  if (phase == Phase::ACTIVE)
    {
      Side side;
      CHECK (GetSideOf (id, side));
      LOG (INFO)
          << "Player " << id << " left the active game in room "
          << GetRoomCode ();
      FinishGame (side == Side::RED ? blackPlayer : redPlayer);
    }
}

void
CheckersRoomState::FinishGame (const PlayerId& w)
{
  phase = Phase::GAME_OVER;
  winner = w;
  currentPlayer.clear ();
  forced.reset ();

  if (winner.empty ())
    LOG (INFO) << "Checkers game in room " << GetRoomCode () << " is over";
  else
    LOG (INFO)
        << "Checkers game in room " << GetRoomCode () << " won by " << winner;
}

void
CheckersRoomState::UpdateGameOver ()
{
  const unsigned red = CountPieces (Side::RED);
  const unsigned black = CountPieces (Side::BLACK);
  if (red == 0 || black == 0)
    {
      if (red > 0)
        FinishGame (redPlayer);
      else if (black > 0)
        FinishGame (blackPlayer);
      else
        FinishGame ("");
      return;
    }

  /* While a capture chain is in progress, the mover keeps the turn and
     has a move by definition.  */
  if (forced)
    return;

  Side toMove;
  CHECK (GetSideOf (currentPlayer, toMove));
  if (!HasAnyMove (toMove))
    {
      LOG (INFO) << currentPlayer << " has no legal moves";
      FinishGame (toMove == Side::RED ? blackPlayer : redPlayer);
    }
}

bool
CheckersRoomState::ApplyMove (const PlayerId& id, const Coord& from,
                              const Coord& to)
{
  switch (phase)
    {
    case Phase::NOT_STARTED:
      LOG (WARNING)
          << "Checkers game in room " << GetRoomCode () << " not started";
      return false;
    case Phase::GAME_OVER:
      LOG (WARNING)
          << "Checkers game in room " << GetRoomCode () << " is already over";
      return false;
    case Phase::ACTIVE:
      break;
    }

  if (id.empty () || id != currentPlayer)
    {
      LOG (WARNING) << "Not the turn of " << id << " in room " << GetRoomCode ();
      return false;
    }

  Side side;
  CHECK (GetSideOf (id, side)) << "Current player " << id << " has no side";

  if (!board.IsInside (from) || !board.IsInside (to))
    {
      LOG (WARNING) << "Move " << from << " -> " << to << " is out of bounds";
      return false;
    }

  if (forced && from != *forced)
    {
      LOG (WARNING)
          << "Capture chain must continue from " << *forced
          << ", not " << from;
      return false;
    }

  if (from == to)
    {
      LOG (WARNING) << "Source and destination are the same: " << from;
      return false;
    }

  const Piece piece = GetPiece (from);
  if (piece == Piece::EMPTY)
    {
      LOG (WARNING) << "No piece at " << from;
      return false;
    }
  if (!BelongsTo (piece, side))
    {
      LOG (WARNING) << "Piece at " << from << " does not belong to " << id;
      return false;
    }

  if (GetPiece (to) != Piece::EMPTY)
    {
      LOG (WARNING) << "Destination " << to << " is not empty";
      return false;
    }

  const int dRow = to.GetRow () - from.GetRow ();
  const int dCol = to.GetColumn () - from.GetColumn ();
  const int dist = std::abs (dRow);
  if (dist != std::abs (dCol))
    {
      LOG (WARNING) << "Move " << from << " -> " << to << " is not diagonal";
      return false;
    }
  if (dist != 1 && dist != 2)
    {
      LOG (WARNING)
          << "Move " << from << " -> " << to << " has invalid distance";
      return false;
    }
  const bool isCapture = (dist == 2);

  if (!IsKing (piece) && dRow != dist * ForwardDirection (side))
    {
      LOG (WARNING) << "Men can only move forward";
      return false;
    }

  if (!isCapture && HasAnyCapture (side))
    {
      LOG (WARNING)
          << "A capture is available, simple move " << from << " -> " << to
          << " is not allowed";
      return false;
    }

  const Coord jumped = from.Offset (dRow / 2, dCol / 2);
  if (isCapture && !BelongsTo (GetPiece (jumped), Opponent (side)))
    {
      LOG (WARNING) << "No opponent piece to capture at " << jumped;
      return false;
    }

  /* The move is valid, apply it.  */

  if (isCapture)
    At (jumped) = Piece::EMPTY;

  Piece moved = piece;
  if (moved == Piece::RED_MAN && to.GetRow () == 0)
    moved = Piece::RED_KING;
  else if (moved == Piece::BLACK_MAN && to.GetRow () == SIZE - 1)
    moved = Piece::BLACK_KING;

  At (from) = Piece::EMPTY;
  At (to) = moved;

  lastMove = LastMove {from, to};
  ++moveNumber;
  VLOG (1)
      << "Room " << GetRoomCode () << ", move " << moveNumber << ": "
      << id << " " << from << " -> " << to;

  if (isCapture && HasCaptureFrom (to))
    forced = to;
  else
    {
      forced.reset ();
      currentPlayer = (side == Side::RED ? blackPlayer : redPlayer);
    }

  UpdateGameOver ();
  return true;
}

bool
CheckersRoomState::Resign (const PlayerId& id)
{
  if (phase != Phase::ACTIVE)
    {
      LOG (WARNING)
          << "No active checkers game to resign in room " << GetRoomCode ();
      return false;
    }

  Side side;
  if (!GetSideOf (id, side))
    {
      LOG (WARNING) << "Player " << id << " cannot resign, not playing";
      return false;
    }

  LOG (INFO) << "Player " << id << " resigned in room " << GetRoomCode ();
  FinishGame (side == Side::RED ? blackPlayer : redPlayer);
  return true;
}

bool
CheckersRoomState::Restart ()
{
  if (joiners.size () != 2)
    {
      LOG (WARNING)
          << "Cannot restart checkers room " << GetRoomCode ()
          << " without two players";
      return false;
    }

  Start ();
  return true;
}

std::string
CheckersRoomState::GetStatusMessage () const
{
  switch (phase)
    {
    case Phase::NOT_STARTED:
      return "Waiting for opponent...";
    case Phase::GAME_OVER:
      if (winner.empty ())
        return "Game over.";
      return winner + " wins!";
    case Phase::ACTIVE:
      break;
    }

  if (forced)
    return "You must continue capturing.";

  return currentPlayer + "'s turn.";
}

std::string
CheckersRoomState::BoardToString () const
{
  std::ostringstream out;
  for (int r = 0; r < SIZE; ++r)
    {
      if (r > 0)
        out << '\n';
      for (int c = 0; c < SIZE; ++c)
        out << PieceToChar (GetPiece (Coord (r, c)));
    }

  return out.str ();
}

} // namespace checkers
