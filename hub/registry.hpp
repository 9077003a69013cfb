// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAMEHUB_HUB_REGISTRY_HPP
#define GAMEHUB_HUB_REGISTRY_HPP

#include "room.hpp"

#include <hub/proto/rooms.pb.h>
#include <hubutil/random.hpp>

#include <json/json.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace gamehub
{

/**
 * Options for running the room registry.
 */
struct HubConfiguration
{

  /**
   * Seed for all randomness (shuffles, side and starter choices).  The
   * same seed and the same sequence of calls yield the same games.  If
   * empty, a seed is taken from the system's secure random source.
   */
  std::string Seed;

  /**
   * If true, the first mover in tic-tac-toe is chosen at random.
   * Otherwise the host (X) always starts.
   */
  bool TicTacToeRandomStarter = false;

  /**
   * Maximum number of players at a blackjack table.  Must be between one
   * and the number of seats.
   */
  unsigned BlackjackCapacity = blackjack::BlackjackRoomState::SEATS;

};

/**
 * The dispatcher holding all live rooms by their code.  Actions for a room
 * are resolved by code and applied to the room's game state under the
 * room's lock, so that different rooms can be driven in parallel while a
 * single room only ever sees one action at a time.
 *
 * All methods report invalid requests (unknown room, full room, illegal
 * action) by returning false; the reason is logged.
 */
class RoomRegistry
{

private:

  const HubConfiguration config;

  /**
   * Base random stream.  Each room gets a stream branched off with its
   * code as key.
   */
  Random rnd;

  /** Lock for the map of rooms (not the rooms themselves).  */
  mutable std::mutex mut;

  std::map<std::string, std::shared_ptr<Room>> rooms;

  /**
   * Looks up a room by code.  Returns null if there is none.
   */
  std::shared_ptr<Room> Find (const std::string& code) const;

  /**
   * Returns the maximum number of members for a room of the given type.
   */
  unsigned GetCapacity (GameType type) const;

  /**
   * Constructs the game state for a new room.
   */
  RoomVariant CreateState (GameType type, const std::string& code) const;

  bool HandleTicTacToe (tictactoe::TicTacToeRoomState& state,
                        const PlayerId& player, const Json::Value& action);
  bool HandleCheckers (checkers::CheckersRoomState& state,
                       const PlayerId& player, const Json::Value& action);
  bool HandleBlackjack (blackjack::BlackjackRoomState& state,
                        const PlayerId& player, const Json::Value& action);

public:

  explicit RoomRegistry (const HubConfiguration& cfg);

  RoomRegistry (const RoomRegistry&) = delete;
  void operator= (const RoomRegistry&) = delete;

  /**
   * Opens a new room with the given code and game.  Fails if the code is
   * empty or already in use.
   */
  bool CreateRoom (GameType type, const std::string& code);

  /**
   * Adds a player to a room and seats them in its game.  Joining a room
   * one is already in succeeds without changing anything.
   */
  bool JoinRoom (const std::string& code, const PlayerId& player);

  /**
   * Removes a player from a room.  When the last player leaves, the room
   * is torn down.
   */
  bool LeaveRoom (const std::string& code, const PlayerId& player);

  /**
   * Applies a player action given as JSON text to the room's game.  The
   * player must be a member of the room.
   */
  bool HandleAction (const std::string& code, const PlayerId& player,
                     const std::string& action);

  /**
   * Fills in the current snapshot of a room.  Returns false if there is
   * no such room.
   */
  bool GetSnapshot (const std::string& code, proto::RoomSnapshot& out) const;

  /**
   * Tears down a room regardless of its members.
   */
  bool RemoveRoom (const std::string& code);

  /**
   * Returns the codes of all live rooms, sorted.
   */
  std::vector<std::string> GetRoomCodes () const;

};

} // namespace gamehub

#endif // GAMEHUB_HUB_REGISTRY_HPP
