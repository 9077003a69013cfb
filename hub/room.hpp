// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAMEHUB_HUB_ROOM_HPP
#define GAMEHUB_HUB_ROOM_HPP

#include <blackjack/state.hpp>
#include <checkers/state.hpp>
#include <rooms/roomstate.hpp>
#include <tictactoe/state.hpp>

#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace gamehub
{

/** The games that can be hosted in a room.  */
enum class GameType
{
  TICTACTOE,
  CHECKERS,
  BLACKJACK,
};

/**
 * Returns the name of a game type as used in scripts and logs
 * ("tictactoe", "checkers", "blackjack").
 */
std::string GameTypeToString (GameType type);

/**
 * Parses a game type name.  Returns false if it is not known.
 */
bool ParseGameType (const std::string& str, GameType& type);

/**
 * The per-game session state of a room.
 */
using RoomVariant = std::variant<tictactoe::TicTacToeRoomState,
                                 checkers::CheckersRoomState,
                                 blackjack::BlackjackRoomState>;

/**
 * A live room:  its game state together with the players that are in it.
 * All access to a room (other than the immutable code and type) must be
 * done while holding its lock.
 */
class Room
{

private:

  RoomVariant state;

  /** Players currently in the room, in join order.  */
  std::vector<PlayerId> members;

  /**
   * Set when the last member has left and the room is being torn down.
   * A closed room does not accept new members.
   */
  bool closed = false;

public:

  /** Lock serialising all actions into this room.  */
  std::mutex mut;

  explicit Room (RoomVariant&& s);

  Room (const Room&) = delete;
  void operator= (const Room&) = delete;

  GameType GetType () const;

  /**
   * Returns the room state through the shared capability.
   */
  const RoomState& GetState () const;

  const std::string&
  GetCode () const
  {
    return GetState ().GetRoomCode ();
  }

  RoomVariant&
  GetVariant ()
  {
    return state;
  }

  const RoomVariant&
  GetVariant () const
  {
    return state;
  }

  const std::vector<PlayerId>&
  GetMembers () const
  {
    return members;
  }

  bool IsMember (const PlayerId& id) const;

  /**
   * Adds the player to the member list.  The player must not be there yet.
   */
  void AddMember (const PlayerId& id);

  /**
   * Removes the player from the member list.  Returns false if the player
   * was not a member.
   */
  bool RemoveMember (const PlayerId& id);

  bool
  IsClosed () const
  {
    return closed;
  }

  void
  Close ()
  {
    closed = true;
  }

};

} // namespace gamehub

#endif // GAMEHUB_HUB_ROOM_HPP
