// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAMEHUB_ROOMS_ROOMSTATE_HPP
#define GAMEHUB_ROOMS_ROOMSTATE_HPP

#include <string>

namespace gamehub
{

/**
 * Identifier of a player within the hub.  Player IDs are assigned by the
 * transport and are never empty; an empty string in any of the state
 * classes means "no player bound".
 */
using PlayerId = std::string;

/**
 * The capability shared by the per-game session states:  a stable room
 * code by which the dispatcher routes actions.  The code is fixed for the
 * lifetime of the state.  Uniqueness across live rooms is enforced by the
 * owning RoomRegistry, not here.
 */
class RoomState
{

private:

  /** The room code.  Never empty.  */
  const std::string roomCode;

protected:

  /**
   * Constructs the state for the given room code, which must not be empty.
   */
  explicit RoomState (const std::string& code);

  RoomState (RoomState&&) = default;

public:

  virtual ~RoomState () = default;

  RoomState (const RoomState&) = delete;
  void operator= (const RoomState&) = delete;

  const std::string&
  GetRoomCode () const
  {
    return roomCode;
  }

};

} // namespace gamehub

#endif // GAMEHUB_ROOMS_ROOMSTATE_HPP
