// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "roomstate.hpp"

#include <gtest/gtest.h>

namespace gamehub
{
namespace
{

/** Minimal concrete state for exercising the base class.  */
class TestRoomState : public RoomState
{

public:

  explicit TestRoomState (const std::string& code)
    : RoomState(code)
  {}

};

TEST (RoomStateTests, RoomCode)
{
  const TestRoomState state("ABCD");
  EXPECT_EQ (state.GetRoomCode (), "ABCD");

  const RoomState& generic = state;
  EXPECT_EQ (generic.GetRoomCode (), "ABCD");
}

TEST (RoomStateTests, EmptyCodeIsFatal)
{
  EXPECT_DEATH (TestRoomState (""), "must not be empty");
}

} // anonymous namespace
} // namespace gamehub
