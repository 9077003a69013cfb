// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "registry.hpp"

#include "actions.hpp"
#include "snapshot.hpp"

#include <hubutil/cryptorand.hpp>
#include <hubutil/hash.hpp>

#include <glog/logging.h>

namespace gamehub
{

RoomRegistry::RoomRegistry (const HubConfiguration& cfg)
  : config(cfg)
{
  CHECK_GE (config.BlackjackCapacity, 1);
  CHECK_LE (config.BlackjackCapacity, blackjack::BlackjackRoomState::SEATS);

  if (config.Seed.empty ())
    {
      LOG (INFO) << "Using a random seed for the room registry";
      rnd.Seed (CryptoRandomSeed ());
    }
  else
    {
      LOG (INFO) << "Using the configured seed for the room registry";
      rnd.Seed (SHA256::Hash (config.Seed));
    }
}

std::shared_ptr<Room>
RoomRegistry::Find (const std::string& code) const
{
  std::lock_guard<std::mutex> lock(mut);

  auto mit = rooms.find (code);
  if (mit == rooms.end ())
    return nullptr;

  return mit->second;
}

unsigned
RoomRegistry::GetCapacity (const GameType type) const
{
  switch (type)
    {
    case GameType::TICTACTOE:
    case GameType::CHECKERS:
      return 2;
    case GameType::BLACKJACK:
      return config.BlackjackCapacity;
    }

  LOG (FATAL) << "Invalid game type: " << static_cast<int> (type);
}

RoomVariant
RoomRegistry::CreateState (const GameType type, const std::string& code) const
{
  Random roomRnd = rnd.BranchOff (code);

  switch (type)
    {
    case GameType::TICTACTOE:
      {
        tictactoe::TicTacToeRoomState::FirstTurnPolicy policy;
        if (config.TicTacToeRandomStarter)
          policy = &tictactoe::TicTacToeRoomState::RandomStarter;
        else
          policy = &tictactoe::TicTacToeRoomState::HostStarts;

        return RoomVariant (std::in_place_type<tictactoe::TicTacToeRoomState>,
                            code, std::move (roomRnd), std::move (policy));
      }

    case GameType::CHECKERS:
      return RoomVariant (std::in_place_type<checkers::CheckersRoomState>,
                          code, std::move (roomRnd));

    case GameType::BLACKJACK:
      {
        auto engine
            = std::make_unique<blackjack::BlackjackEngine> (std::move (roomRnd));
        return RoomVariant (std::in_place_type<blackjack::BlackjackRoomState>,
                            code, std::move (engine));
      }
    }

  LOG (FATAL) << "Invalid game type: " << static_cast<int> (type);
}

bool
RoomRegistry::CreateRoom (const GameType type, const std::string& code)
{
  if (code.empty ())
    {
      LOG (WARNING) << "Cannot create a room with empty code";
      return false;
    }

  std::lock_guard<std::mutex> lock(mut);
  if (rooms.count (code) > 0)
    {
      LOG (WARNING) << "Room code " << code << " is already in use";
      return false;
    }

  rooms.emplace (code, std::make_shared<Room> (CreateState (type, code)));
  LOG (INFO)
      << "Created " << GameTypeToString (type) << " room " << code;

  return true;
}

bool
RoomRegistry::JoinRoom (const std::string& code, const PlayerId& player)
{
  if (player.empty ())
    {
      LOG (WARNING) << "Empty player ID cannot join room " << code;
      return false;
    }

  auto room = Find (code);
  if (room == nullptr)
    {
      LOG (WARNING) << "Player " << player << " tried to join unknown room "
                    << code;
      return false;
    }

  std::lock_guard<std::mutex> lock(room->mut);
  if (room->IsClosed ())
    {
      LOG (WARNING) << "Room " << code << " is being torn down";
      return false;
    }
  if (room->IsMember (player))
    return true;

  if (room->GetMembers ().size () >= GetCapacity (room->GetType ()))
    {
      LOG (WARNING) << "Room " << code << " is full, rejecting " << player;
      return false;
    }

  bool ok = false;
  RoomVariant& state = room->GetVariant ();
  if (auto* ttt = std::get_if<tictactoe::TicTacToeRoomState> (&state))
    {
      tictactoe::Mark mark;
      ok = ttt->SeatPlayer (player, mark);
    }
  else if (auto* ch = std::get_if<checkers::CheckersRoomState> (&state))
    ok = ch->Join (player);
  else if (auto* bj = std::get_if<blackjack::BlackjackRoomState> (&state))
    ok = bj->Join (player);

  if (!ok)
    return false;

  room->AddMember (player);
  LOG (INFO) << "Player " << player << " joined room " << code;

  return true;
}

bool
RoomRegistry::LeaveRoom (const std::string& code, const PlayerId& player)
{
  auto room = Find (code);
  if (room == nullptr)
    {
      LOG (WARNING) << "Player " << player << " tried to leave unknown room "
                    << code;
      return false;
    }

  std::lock_guard<std::mutex> lock(room->mut);
  if (!room->RemoveMember (player))
    {
      LOG (WARNING) << "Player " << player << " is not in room " << code;
      return false;
    }
  LOG (INFO) << "Player " << player << " left room " << code;

  RoomVariant& state = room->GetVariant ();
  if (auto* ttt = std::get_if<tictactoe::TicTacToeRoomState> (&state))
    {
      /* A running game is abandoned when one of its players leaves.  */
      if (!ttt->UnseatPlayer (player))
        {
          ttt->Restart ();
          CHECK (ttt->UnseatPlayer (player));
        }
    }
  else if (auto* ch = std::get_if<checkers::CheckersRoomState> (&state))
    ch->PlayerLeft (player);
  else if (auto* bj = std::get_if<blackjack::BlackjackRoomState> (&state))
    bj->Leave (player);

  if (room->GetMembers ().empty ())
    {
      room->Close ();

      std::lock_guard<std::mutex> mapLock(mut);
      auto mit = rooms.find (code);
      if (mit != rooms.end () && mit->second == room)
        rooms.erase (mit);

      LOG (INFO) << "Room " << code << " is empty and was torn down";
    }

  return true;
}

bool
RoomRegistry::HandleTicTacToe (tictactoe::TicTacToeRoomState& state,
                               const PlayerId& player,
                               const Json::Value& action)
{
  TicTacToeAction parsed;
  if (!ParseTicTacToeAction (action, parsed))
    {
      LOG (WARNING) << "Invalid tic-tac-toe action: " << action;
      return false;
    }

  switch (parsed.kind)
    {
    case TicTacToeAction::Kind::MOVE:
      return state.ApplyMove (player, parsed.cell);

    case TicTacToeAction::Kind::RESTART:
      if (!state.IsGameOver ())
        {
          LOG (WARNING) << "Restart requested while game is running";
          return false;
        }
      state.Restart ();
      return true;
    }

  LOG (FATAL) << "Invalid action kind";
}

bool
RoomRegistry::HandleCheckers (checkers::CheckersRoomState& state,
                              const PlayerId& player,
                              const Json::Value& action)
{
  CheckersAction parsed;
  if (!ParseCheckersAction (action, parsed))
    {
      LOG (WARNING) << "Invalid checkers action: " << action;
      return false;
    }

  switch (parsed.kind)
    {
    case CheckersAction::Kind::MOVE:
      return state.ApplyMove (player, parsed.from, parsed.to);

    case CheckersAction::Kind::RESIGN:
      return state.Resign (player);

    case CheckersAction::Kind::RESTART:
      if (!state.IsGameOver ())
        {
          LOG (WARNING) << "Restart requested while game is running";
          return false;
        }
      return state.Restart ();
    }

  LOG (FATAL) << "Invalid action kind";
}

bool
RoomRegistry::HandleBlackjack (blackjack::BlackjackRoomState& state,
                               const PlayerId& player,
                               const Json::Value& action)
{
  BlackjackAction parsed;
  if (!ParseBlackjackAction (action, parsed))
    {
      LOG (WARNING) << "Invalid blackjack action: " << action;
      return false;
    }

  switch (parsed.kind)
    {
    case BlackjackAction::Kind::START:
      return state.StartRound (player);

    case BlackjackAction::Kind::PLAY:
      return state.ApplyAction (player, parsed.play);
    }

  LOG (FATAL) << "Invalid action kind";
}

bool
RoomRegistry::HandleAction (const std::string& code, const PlayerId& player,
                            const std::string& action)
{
  Json::Value parsed;
  if (!ParseActionJson (action, parsed))
    return false;

  auto room = Find (code);
  if (room == nullptr)
    {
      LOG (WARNING) << "Action for unknown room " << code;
      return false;
    }

  std::lock_guard<std::mutex> lock(room->mut);
  if (!room->IsMember (player))
    {
      LOG (WARNING) << "Player " << player << " is not in room " << code;
      return false;
    }

  VLOG (1) << "Room " << code << ", action by " << player << ": " << action;

  RoomVariant& state = room->GetVariant ();
  if (auto* ttt = std::get_if<tictactoe::TicTacToeRoomState> (&state))
    return HandleTicTacToe (*ttt, player, parsed);
  if (auto* ch = std::get_if<checkers::CheckersRoomState> (&state))
    return HandleCheckers (*ch, player, parsed);
  if (auto* bj = std::get_if<blackjack::BlackjackRoomState> (&state))
    return HandleBlackjack (*bj, player, parsed);

  LOG (FATAL) << "Room variant holds no state";
}

bool
RoomRegistry::GetSnapshot (const std::string& code,
                           proto::RoomSnapshot& out) const
{
  auto room = Find (code);
  if (room == nullptr)
    return false;

  std::lock_guard<std::mutex> lock(room->mut);
  out = RoomToProto (*room);

  return true;
}

bool
RoomRegistry::RemoveRoom (const std::string& code)
{
  std::shared_ptr<Room> room;
  {
    std::lock_guard<std::mutex> lock(mut);
    auto mit = rooms.find (code);
    if (mit == rooms.end ())
      {
        LOG (WARNING) << "Cannot remove unknown room " << code;
        return false;
      }

    room = mit->second;
    rooms.erase (mit);
  }

  std::lock_guard<std::mutex> lock(room->mut);
  room->Close ();
  LOG (INFO) << "Removed room " << code;

  return true;
}

std::vector<std::string>
RoomRegistry::GetRoomCodes () const
{
  std::lock_guard<std::mutex> lock(mut);

  std::vector<std::string> res;
  for (const auto& entry : rooms)
    res.push_back (entry.first);

  return res;
}

} // namespace gamehub
