// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "state.hpp"

#include <hubutil/hash.hpp>

#include <gtest/gtest.h>

namespace tictactoe
{
namespace
{

gamehub::Random
TestRandom ()
{
  gamehub::Random res;
  res.Seed (gamehub::SHA256::Hash ("tictactoe"));
  return res;
}

class TicTacToeTests : public testing::Test
{

protected:

  TicTacToeRoomState state;

  TicTacToeTests ()
    : state("ROOM", TestRandom ())
  {}

  /**
   * Seats "host" and "guest" as X and O.
   */
  void
  SeatBoth ()
  {
    Mark m;
    ASSERT_TRUE (state.SeatPlayer ("host", m));
    ASSERT_EQ (m, Mark::X);
    ASSERT_TRUE (state.SeatPlayer ("guest", m));
    ASSERT_EQ (m, Mark::O);
  }

  /**
   * Plays the given cells, alternating between the current players.
   */
  void
  Play (const std::vector<int>& indices)
  {
    for (const int ind : indices)
      ASSERT_TRUE (state.ApplyMove (state.GetCurrentPlayer (), ind));
  }

};

TEST_F (TicTacToeTests, InitialState)
{
  EXPECT_EQ (state.GetRoomCode (), "ROOM");
  for (const auto c : state.GetCells ())
    EXPECT_EQ (c, Mark::NONE);
  EXPECT_FALSE (state.IsReady ());
  EXPECT_FALSE (state.IsGameOver ());
  EXPECT_EQ (state.GetStatusMessage (), "Waiting for opponent...");
}

TEST_F (TicTacToeTests, Seating)
{
  Mark m;
  ASSERT_TRUE (state.SeatPlayer ("host", m));
  EXPECT_EQ (m, Mark::X);
  EXPECT_EQ (state.GetCurrentPlayer (), "host");
  EXPECT_FALSE (state.IsReady ());

  ASSERT_TRUE (state.SeatPlayer ("host", m));
  EXPECT_EQ (m, Mark::X);

  ASSERT_TRUE (state.SeatPlayer ("guest", m));
  EXPECT_EQ (m, Mark::O);
  EXPECT_TRUE (state.IsReady ());
  EXPECT_EQ (state.GetPlayerX (), "host");
  EXPECT_EQ (state.GetPlayerO (), "guest");
  EXPECT_EQ (state.GetCurrentPlayer (), "host");

  EXPECT_FALSE (state.SeatPlayer ("third", m));
  EXPECT_EQ (state.GetMarkOf ("third"), Mark::NONE);
}

TEST_F (TicTacToeTests, NoMovesBeforeReady)
{
  Mark m;
  ASSERT_TRUE (state.SeatPlayer ("host", m));
  EXPECT_FALSE (state.ApplyMove ("host", 4));
  EXPECT_EQ (state.GetCells ()[4], Mark::NONE);
}

TEST_F (TicTacToeTests, TurnsAlternate)
{
  SeatBoth ();

  EXPECT_FALSE (state.ApplyMove ("guest", 0));
  ASSERT_TRUE (state.ApplyMove ("host", 0));
  EXPECT_EQ (state.GetCurrentPlayer (), "guest");
  EXPECT_FALSE (state.ApplyMove ("host", 1));
  ASSERT_TRUE (state.ApplyMove ("guest", 1));
  EXPECT_EQ (state.GetCurrentPlayer (), "host");
  ASSERT_TRUE (state.ApplyMove ("host", 2));
  EXPECT_EQ (state.GetCurrentPlayer (), "guest");

  EXPECT_EQ (state.GetCells ()[0], Mark::X);
  EXPECT_EQ (state.GetCells ()[1], Mark::O);
  EXPECT_EQ (state.GetCells ()[2], Mark::X);
  EXPECT_EQ (state.GetMoveCount (), 3);
}

TEST_F (TicTacToeTests, OccupiedCellRejected)
{
  SeatBoth ();
  ASSERT_TRUE (state.ApplyMove ("host", 4));

  const auto before = state.GetCells ();
  EXPECT_FALSE (state.ApplyMove ("guest", 4));
  EXPECT_EQ (state.GetCells (), before);
  EXPECT_EQ (state.GetCurrentPlayer (), "guest");
  EXPECT_EQ (state.GetMoveCount (), 1);
}

TEST_F (TicTacToeTests, OutOfRangeRejected)
{
  SeatBoth ();
  EXPECT_FALSE (state.ApplyMove ("host", -1));
  EXPECT_FALSE (state.ApplyMove ("host", 9));
  EXPECT_FALSE (state.ApplyMove ("host", 3, 0));
  EXPECT_FALSE (state.ApplyMove ("host", 0, -1));
  EXPECT_EQ (state.GetCurrentPlayer (), "host");
}

TEST_F (TicTacToeTests, MoveByRowAndColumn)
{
  SeatBoth ();
  ASSERT_TRUE (state.ApplyMove ("host", 2, 1));
  EXPECT_EQ (state.GetCells ()[7], Mark::X);
}

TEST_F (TicTacToeTests, AllWinningLines)
{
  struct Line
  {
    int a, b, c;
  };
  const Line lines[] =
    {
      {0, 1, 2}, {3, 4, 5}, {6, 7, 8},
      {0, 3, 6}, {1, 4, 7}, {2, 5, 8},
      {0, 4, 8}, {2, 4, 6},
    };

  for (const auto& l : lines)
    {
      TicTacToeRoomState s("ROOM", TestRandom ());
      Mark m;
      ASSERT_TRUE (s.SeatPlayer ("host", m));
      ASSERT_TRUE (s.SeatPlayer ("guest", m));

      /* O takes the first two cells off the line.  */
      std::vector<int> others;
      for (int i = 0; i < TicTacToeRoomState::CELLS && others.size () < 2; ++i)
        if (i != l.a && i != l.b && i != l.c)
          others.push_back (i);

      ASSERT_TRUE (s.ApplyMove ("host", l.a));
      ASSERT_TRUE (s.ApplyMove ("guest", others[0]));
      ASSERT_TRUE (s.ApplyMove ("host", l.b));
      ASSERT_TRUE (s.ApplyMove ("guest", others[1]));
      ASSERT_FALSE (s.IsGameOver ());
      ASSERT_TRUE (s.ApplyMove ("host", l.c));

      EXPECT_TRUE (s.IsGameOver ()) << l.a << l.b << l.c;
      EXPECT_EQ (s.GetWinner (), "host");
      EXPECT_FALSE (s.IsDraw ());
    }
}

TEST_F (TicTacToeTests, SecondPlayerWins)
{
  SeatBoth ();
  Play ({0, 3, 1, 4, 8, 5});

  EXPECT_TRUE (state.IsGameOver ());
  EXPECT_EQ (state.GetWinner (), "guest");
  EXPECT_EQ (state.GetStatusMessage (), "Game over: guest wins.");
}

TEST_F (TicTacToeTests, Draw)
{
  SeatBoth ();
  /* X O X
     X O O
     O X X  */
  Play ({0, 1, 2, 4, 3, 5, 7, 6, 8});

  EXPECT_TRUE (state.IsGameOver ());
  EXPECT_TRUE (state.IsDraw ());
  EXPECT_EQ (state.GetWinner (), "");
  EXPECT_EQ (state.GetStatusMessage (), "Game over: draw.");
}

TEST_F (TicTacToeTests, WinOnLastCellIsNotDraw)
{
  SeatBoth ();
  /* X O X
     O X O
     O X X  */
  Play ({0, 1, 2, 3, 4, 5, 7, 6});
  ASSERT_FALSE (state.IsGameOver ());
  Play ({8});

  EXPECT_TRUE (state.IsGameOver ());
  EXPECT_FALSE (state.IsDraw ());
  EXPECT_EQ (state.GetWinner (), "host");
}

TEST_F (TicTacToeTests, NoMovesAfterGameOver)
{
  SeatBoth ();
  Play ({0, 3, 1, 4, 2});
  ASSERT_TRUE (state.IsGameOver ());

  EXPECT_FALSE (state.ApplyMove ("guest", 8));
  EXPECT_FALSE (state.ApplyMove ("host", 8));
  EXPECT_EQ (state.GetCells ()[8], Mark::NONE);
}

TEST_F (TicTacToeTests, Restart)
{
  SeatBoth ();
  Play ({0, 3, 1, 4, 2});
  ASSERT_TRUE (state.IsGameOver ());

  state.Restart ();
  EXPECT_FALSE (state.IsGameOver ());
  EXPECT_EQ (state.GetWinner (), "");
  EXPECT_EQ (state.GetMoveCount (), 0);
  EXPECT_EQ (state.GetPlayerX (), "host");
  EXPECT_EQ (state.GetPlayerO (), "guest");
  EXPECT_EQ (state.GetCurrentPlayer (), "host");
  for (const auto c : state.GetCells ())
    EXPECT_EQ (c, Mark::NONE);
}

TEST_F (TicTacToeTests, Unseat)
{
  SeatBoth ();
  ASSERT_TRUE (state.UnseatPlayer ("host"));
  EXPECT_FALSE (state.IsReady ());
  EXPECT_EQ (state.GetCurrentPlayer (), "guest");

  Mark m;
  ASSERT_TRUE (state.SeatPlayer ("newcomer", m));
  EXPECT_EQ (m, Mark::X);
  EXPECT_TRUE (state.IsReady ());

  ASSERT_TRUE (state.ApplyMove (state.GetCurrentPlayer (), 0));
  EXPECT_FALSE (state.UnseatPlayer ("guest"));
  EXPECT_FALSE (state.UnseatPlayer ("unknown"));
}

TEST (TicTacToePolicyTests, InjectedStarter)
{
  TicTacToeRoomState state("ROOM", TestRandom (),
                           [] (gamehub::Random&) { return Mark::O; });

  Mark m;
  ASSERT_TRUE (state.SeatPlayer ("host", m));
  ASSERT_TRUE (state.SeatPlayer ("guest", m));
  EXPECT_EQ (state.GetCurrentPlayer (), "guest");
  EXPECT_FALSE (state.ApplyMove ("host", 0));
  EXPECT_TRUE (state.ApplyMove ("guest", 0));
  EXPECT_EQ (state.GetCells ()[0], Mark::O);
}

TEST (TicTacToePolicyTests, RandomStarterPicksBoth)
{
  gamehub::Random rnd = TestRandom ();
  bool seenX = false;
  bool seenO = false;
  for (unsigned i = 0; i < 100; ++i)
    {
      const Mark m = TicTacToeRoomState::RandomStarter (rnd);
      ASSERT_NE (m, Mark::NONE);
      seenX |= (m == Mark::X);
      seenO |= (m == Mark::O);
    }

  EXPECT_TRUE (seenX);
  EXPECT_TRUE (seenO);
}

TEST (OpponentTests, Basic)
{
  EXPECT_EQ (Opponent (Mark::X), Mark::O);
  EXPECT_EQ (Opponent (Mark::O), Mark::X);
  EXPECT_DEATH (Opponent (Mark::NONE), "Invalid mark");
}

} // anonymous namespace
} // namespace tictactoe
