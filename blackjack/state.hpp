// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAMEHUB_BLACKJACK_STATE_HPP
#define GAMEHUB_BLACKJACK_STATE_HPP

#include "engine.hpp"

#include <rooms/roomstate.hpp>

#include <array>
#include <memory>
#include <string>

namespace blackjack
{

/**
 * Session state of a blackjack room:  a table of four seats and the
 * engine that plays the rounds.  A player occupies at most one seat.
 */
class BlackjackRoomState : public gamehub::RoomState
{

public:

  /** Number of seats at the table.  */
  static constexpr int SEATS = 4;

private:

  std::unique_ptr<Engine> engine;

  /** Player in each seat, empty for a free seat.  */
  std::array<PlayerId, SEATS> seats;

public:

  explicit BlackjackRoomState (const std::string& code,
                               std::unique_ptr<Engine> e);

  BlackjackRoomState (BlackjackRoomState&&) = default;

  /**
   * Returns the seat of the player, claiming the first free one if the
   * player is not seated yet.  If the table is full, seat 0 is returned
   * without being claimed; callers are expected to cap the number of
   * players before.
   */
  int GetOrAssignSeatForPlayer (const PlayerId& id);

  /**
   * Frees all seats bound to the given player.
   */
  void UnseatPlayer (const PlayerId& id);

  /**
   * Looks up the seat of a player.  Returns false if not seated.
   */
  bool TryGetSeatIndex (const PlayerId& id, int& seat) const;

  /**
   * Returns the number of occupied seats.
   */
  int GetSeatedCount () const;

  /**
   * Seats the player and registers them with the engine.  Returns false
   * if the table is full.
   */
  bool Join (const PlayerId& id);

  /**
   * Frees the player's seat and removes them from the engine.
   */
  void Leave (const PlayerId& id);

  /**
   * Starts a round on request of the given player, who must be seated.
   */
  bool StartRound (const PlayerId& id);

  /**
   * Forwards a hit or stand by a seated player to the engine.
   */
  bool ApplyAction (const PlayerId& id, Action a);

  /**
   * Returns true once the engine has left the lobby phase.
   */
  bool
  IsGameStarted () const
  {
    return engine->GetPhase () != Phase::LOBBY;
  }

  const std::array<PlayerId, SEATS>&
  GetSeats () const
  {
    return seats;
  }

  const Engine&
  GetEngine () const
  {
    return *engine;
  }

};

} // namespace blackjack

#endif // GAMEHUB_BLACKJACK_STATE_HPP
