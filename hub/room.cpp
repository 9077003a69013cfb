// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "room.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace gamehub
{

std::string
GameTypeToString (const GameType type)
{
  switch (type)
    {
    case GameType::TICTACTOE:
      return "tictactoe";
    case GameType::CHECKERS:
      return "checkers";
    case GameType::BLACKJACK:
      return "blackjack";
    }

  LOG (FATAL) << "Invalid game type: " << static_cast<int> (type);
}

bool
ParseGameType (const std::string& str, GameType& type)
{
  if (str == "tictactoe")
    type = GameType::TICTACTOE;
  else if (str == "checkers")
    type = GameType::CHECKERS;
  else if (str == "blackjack")
    type = GameType::BLACKJACK;
  else
    return false;

  return true;
}

Room::Room (RoomVariant&& s)
  : state(std::move (s))
{}

GameType
Room::GetType () const
{
  if (std::holds_alternative<tictactoe::TicTacToeRoomState> (state))
    return GameType::TICTACTOE;
  if (std::holds_alternative<checkers::CheckersRoomState> (state))
    return GameType::CHECKERS;
  if (std::holds_alternative<blackjack::BlackjackRoomState> (state))
    return GameType::BLACKJACK;

  LOG (FATAL) << "Room variant holds no state";
}

const RoomState&
Room::GetState () const
{
  return std::visit ([] (const auto& s) -> const RoomState& { return s; },
                     state);
}

bool
Room::IsMember (const PlayerId& id) const
{
  return std::find (members.begin (), members.end (), id) != members.end ();
}

void
Room::AddMember (const PlayerId& id)
{
  CHECK (!id.empty ());
  CHECK (!IsMember (id)) << id << " is already in room " << GetCode ();
  members.push_back (id);
}

bool
Room::RemoveMember (const PlayerId& id)
{
  auto mit = std::find (members.begin (), members.end (), id);
  if (mit == members.end ())
    return false;

  members.erase (mit);
  return true;
}

} // namespace gamehub
