// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "replay.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace gamehub
{
namespace
{

class ScriptReplayerTests : public testing::Test
{

protected:

  RoomRegistry registry;
  ScriptReplayer replayer;

  ScriptReplayerTests ()
    : registry(Config ()), replayer(registry)
  {}

  static HubConfiguration
  Config ()
  {
    HubConfiguration res;
    res.Seed = "replay";
    return res;
  }

};

TEST_F (ScriptReplayerTests, ValidScript)
{
  std::istringstream in(R"(# a short tic-tac-toe game
{"op": "create", "room": "A", "game": "tictactoe"}
{"op": "join", "room": "A", "player": "x"}

{"op": "join", "room": "A", "player": "o"}
{"op": "action", "room": "A", "player": "x", "action": {"cell": 4}}
{"op": "action", "room": "A", "player": "x", "action": {"cell": 0}}
{"op": "join", "room": "B", "player": "x"}
)");

  ASSERT_TRUE (replayer.ProcessStream (in));
  EXPECT_EQ (replayer.GetAccepted (), 4u);
  EXPECT_EQ (replayer.GetRejected (), 2u);

  proto::RoomSnapshot pb;
  ASSERT_TRUE (registry.GetSnapshot ("A", pb));
  EXPECT_EQ (pb.tictactoe ().move_count (), 1);
  EXPECT_EQ (pb.tictactoe ().current_player (), "o");
}

TEST_F (ScriptReplayerTests, MalformedCommands)
{
  for (const std::string line : {
         "not json",
         "[]",
         R"({"room": "A"})",
         R"({"op": "create", "room": "A"})",
         R"({"op": "create", "room": "A", "game": "chess"})",
         R"({"op": "create", "room": 5, "game": "checkers"})",
         R"({"op": "join", "room": "A"})",
         R"({"op": "join", "room": "A", "player": "x", "extra": 1})",
         R"({"op": "action", "room": "A", "player": "x"})",
         R"({"op": "action", "room": "A", "player": "x", "action": 4})",
         R"({"op": "remove", "room": "A", "player": "x"})",
         R"({"op": "explode", "room": "A", "player": "x"})",
       })
    EXPECT_FALSE (replayer.ProcessLine (line)) << line;

  EXPECT_EQ (replayer.GetAccepted (), 0u);
  EXPECT_EQ (replayer.GetRejected (), 0u);
  EXPECT_TRUE (registry.GetRoomCodes ().empty ());
}

TEST_F (ScriptReplayerTests, StopsAtMalformedLine)
{
  std::istringstream in(R"({"op": "create", "room": "A", "game": "checkers"}
{"op": "bogus"}
{"op": "create", "room": "B", "game": "checkers"}
)");

  EXPECT_FALSE (replayer.ProcessStream (in));
  EXPECT_EQ (registry.GetRoomCodes (), std::vector<std::string> ({"A"}));
}

TEST_F (ScriptReplayerTests, PrintsSnapshots)
{
  std::ostringstream out;
  replayer.SetSnapshotStream (out);

  ASSERT_TRUE (replayer.ProcessLine (
      R"({"op": "create", "room": "J", "game": "blackjack"})"));
  EXPECT_NE (out.str ().find ("room_code: \"J\""), std::string::npos);
  EXPECT_NE (out.str ().find ("blackjack {"), std::string::npos);

  out.str ("");
  ASSERT_TRUE (replayer.ProcessLine (R"({"op": "remove", "room": "J"})"));
  EXPECT_EQ (out.str (), "# room J is closed\n");
}

} // anonymous namespace
} // namespace gamehub
