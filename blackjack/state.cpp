// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "state.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace blackjack
{

BlackjackRoomState::BlackjackRoomState (const std::string& code,
                                        std::unique_ptr<Engine> e)
  : RoomState(code), engine(std::move (e))
{
  CHECK (engine != nullptr);
}

int
BlackjackRoomState::GetOrAssignSeatForPlayer (const PlayerId& id)
{
  CHECK (!id.empty ());

  int seat;
  if (TryGetSeatIndex (id, seat))
    return seat;

  for (int i = 0; i < SEATS; ++i)
    if (seats[i].empty ())
      {
        seats[i] = id;
        VLOG (1)
            << "Seated " << id << " at seat " << i
            << " in room " << GetRoomCode ();
        return i;
      }

  LOG (WARNING)
      << "Blackjack table in room " << GetRoomCode () << " is full, "
      << id << " falls back to seat 0";
  return 0;
}

void
BlackjackRoomState::UnseatPlayer (const PlayerId& id)
{
  if (id.empty ())
    return;

  for (auto& s : seats)
    if (s == id)
      s.clear ();
}

bool
BlackjackRoomState::TryGetSeatIndex (const PlayerId& id, int& seat) const
{
  if (id.empty ())
    return false;

  for (int i = 0; i < SEATS; ++i)
    if (seats[i] == id)
      {
        seat = i;
        return true;
      }

  return false;
}

int
BlackjackRoomState::GetSeatedCount () const
{
  return std::count_if (seats.begin (), seats.end (),
                        [] (const PlayerId& s) { return !s.empty (); });
}

bool
BlackjackRoomState::Join (const PlayerId& id)
{
  int seat;
  if (!TryGetSeatIndex (id, seat) && GetSeatedCount () >= SEATS)
    {
      LOG (WARNING)
          << "Blackjack table in room " << GetRoomCode ()
          << " is full, rejecting " << id;
      return false;
    }

  seat = GetOrAssignSeatForPlayer (id);
  engine->EnsurePlayer (id);
  LOG (INFO)
      << "Player " << id << " sits at seat " << seat
      << " in room " << GetRoomCode ();

  return true;
}

void
BlackjackRoomState::Leave (const PlayerId& id)
{
  UnseatPlayer (id);
  engine->RemovePlayer (id);
}

bool
BlackjackRoomState::StartRound (const PlayerId& id)
{
  int seat;
  if (!TryGetSeatIndex (id, seat))
    {
      LOG (WARNING) << "Unseated player " << id << " cannot start a round";
      return false;
    }

  return engine->StartRound ();
}

bool
BlackjackRoomState::ApplyAction (const PlayerId& id, const Action a)
{
  int seat;
  if (!TryGetSeatIndex (id, seat))
    {
      LOG (WARNING) << "Unseated player " << id << " cannot act";
      return false;
    }

  return engine->ApplyAction (id, a);
}

} // namespace blackjack
