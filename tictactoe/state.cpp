// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "state.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace tictactoe
{

namespace
{

/** All eight winning lines, by cell index.  */
constexpr int WINNING_LINES[][3] =
  {
    /* Rows.  */
    {0, 1, 2},
    {3, 4, 5},
    {6, 7, 8},

    /* Columns.  */
    {0, 3, 6},
    {1, 4, 7},
    {2, 5, 8},

    /* Diagonals.  */
    {0, 4, 8},
    {2, 4, 6},
  };

} // anonymous namespace

Mark
Opponent (const Mark m)
{
  switch (m)
    {
    case Mark::X:
      return Mark::O;
    case Mark::O:
      return Mark::X;
    default:
      break;
    }

  LOG (FATAL) << "Invalid mark: " << static_cast<int> (m);
}

Mark
TicTacToeRoomState::HostStarts (gamehub::Random&)
{
  return Mark::X;
}

Mark
TicTacToeRoomState::RandomStarter (gamehub::Random& rnd)
{
  return rnd.Next<bool> () ? Mark::X : Mark::O;
}

TicTacToeRoomState::TicTacToeRoomState (const std::string& code,
                                        gamehub::Random&& r,
                                        FirstTurnPolicy ft)
  : RoomState(code), board(3, 3), rnd(std::move (r)),
    firstTurn(std::move (ft))
{
  CHECK_EQ (board.GetCellCount (), CELLS);
  CHECK (firstTurn != nullptr);
  cells.fill (Mark::NONE);
}

const PlayerId&
TicTacToeRoomState::GetPlayer (const Mark m) const
{
  switch (m)
    {
    case Mark::X:
      return playerX;
    case Mark::O:
      return playerO;
    default:
      break;
    }

  LOG (FATAL) << "Invalid mark: " << static_cast<int> (m);
}

Mark
TicTacToeRoomState::GetMarkOf (const PlayerId& id) const
{
  if (id.empty ())
    return Mark::NONE;
  if (id == playerX)
    return Mark::X;
  if (id == playerO)
    return Mark::O;
  return Mark::NONE;
}

void
TicTacToeRoomState::ChooseStarter ()
{
  CHECK (IsReady ());
  const Mark starter = firstTurn (rnd);
  currentPlayer = GetPlayer (starter);
  LOG (INFO)
      << "Room " << GetRoomCode () << ": " << currentPlayer << " starts";
}

bool
TicTacToeRoomState::SeatPlayer (const PlayerId& id, Mark& mark)
{
  CHECK (!id.empty ());

  mark = GetMarkOf (id);
  if (mark != Mark::NONE)
    return true;

  if (playerX.empty ())
    {
      playerX = id;
      mark = Mark::X;
      if (playerO.empty ())
        currentPlayer = playerX;
    }
  else if (playerO.empty ())
    {
      playerO = id;
      mark = Mark::O;
    }
  else
    {
      LOG (WARNING)
          << "Room " << GetRoomCode () << " is full, cannot seat " << id;
      return false;
    }

  if (IsReady () && moveCount == 0 && !gameOver)
    ChooseStarter ();

  return true;
}

bool
TicTacToeRoomState::UnseatPlayer (const PlayerId& id)
{
  const Mark m = GetMarkOf (id);
  if (m == Mark::NONE)
    return false;

  if (moveCount > 0)
    {
      LOG (WARNING)
          << "Cannot unseat " << id << " from running game in room "
          << GetRoomCode ();
      return false;
    }

  if (m == Mark::X)
    playerX.clear ();
  else
    playerO.clear ();

  if (!playerX.empty ())
    currentPlayer = playerX;
  else
    currentPlayer = playerO;

  return true;
}

bool
TicTacToeRoomState::HasLine (const Mark m) const
{
  for (const auto& line : WINNING_LINES)
    if (cells[line[0]] == m && cells[line[1]] == m && cells[line[2]] == m)
      return true;

  return false;
}

bool
TicTacToeRoomState::IsFull () const
{
  return std::none_of (cells.begin (), cells.end (),
                       [] (const Mark m) { return m == Mark::NONE; });
}

bool
TicTacToeRoomState::ApplyMove (const PlayerId& id, const int index)
{
  if (gameOver)
    {
      LOG (WARNING) << "Move in room " << GetRoomCode () << " after game over";
      return false;
    }
  if (!IsReady ())
    {
      LOG (WARNING) << "Room " << GetRoomCode () << " is waiting for players";
      return false;
    }
  if (id.empty () || id != currentPlayer)
    {
      LOG (WARNING)
          << "Player " << id << " moved out of turn in room " << GetRoomCode ();
      return false;
    }
  if (index < 0 || index >= CELLS)
    {
      LOG (WARNING) << "Cell index out of range: " << index;
      return false;
    }
  if (cells[index] != Mark::NONE)
    {
      LOG (WARNING) << "Cell " << index << " is already occupied";
      return false;
    }

  const Mark mark = GetMarkOf (id);
  CHECK (mark != Mark::NONE);

  cells[index] = mark;
  ++moveCount;
  VLOG (1)
      << "Room " << GetRoomCode () << ": " << id << " marked cell " << index;

  if (HasLine (mark))
    {
      gameOver = true;
      winner = id;
      draw = false;
      LOG (INFO) << "Room " << GetRoomCode () << ": " << id << " wins";
    }
  else if (IsFull ())
    {
      gameOver = true;
      winner.clear ();
      draw = true;
      LOG (INFO) << "Room " << GetRoomCode () << ": draw";
    }
  else
    currentPlayer = GetPlayer (Opponent (mark));

  return true;
}

bool
TicTacToeRoomState::ApplyMove (const PlayerId& id, const int row,
                               const int col)
{
  if (!board.IsInside (row, col))
    {
      LOG (WARNING)
          << "Cell " << gamehub::Coord (row, col) << " is outside the board";
      return false;
    }

  return ApplyMove (id, board.ToIndex (row, col));
}

void
TicTacToeRoomState::Restart ()
{
  cells.fill (Mark::NONE);
  gameOver = false;
  winner.clear ();
  draw = false;
  moveCount = 0;

  if (IsReady ())
    ChooseStarter ();
  else
    currentPlayer = playerX.empty () ? playerO : playerX;

  LOG (INFO) << "Room " << GetRoomCode () << " restarted";
}

std::string
TicTacToeRoomState::GetStatusMessage () const
{
  if (gameOver)
    {
      if (draw)
        return "Game over: draw.";
      return "Game over: " + winner + " wins.";
    }

  if (!IsReady ())
    return "Waiting for opponent...";

  return currentPlayer + "'s turn.";
}

} // namespace tictactoe
