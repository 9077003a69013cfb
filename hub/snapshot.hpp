// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAMEHUB_HUB_SNAPSHOT_HPP
#define GAMEHUB_HUB_SNAPSHOT_HPP

#include "room.hpp"

#include <hub/proto/rooms.pb.h>

namespace gamehub
{

/**
 * Converts the state of a tic-tac-toe room to its snapshot proto.
 */
proto::TicTacToeState TicTacToeToProto (
    const tictactoe::TicTacToeRoomState& state);

proto::CheckersState CheckersToProto (const checkers::CheckersRoomState& state);

/**
 * Converts a blackjack table to its snapshot.  The dealer's hole card is
 * sent face down until the engine reveals it.
 */
proto::BlackjackState BlackjackToProto (
    const blackjack::BlackjackRoomState& state);

/**
 * Builds the full snapshot of a room.  The caller must hold the room's
 * lock.
 */
proto::RoomSnapshot RoomToProto (const Room& room);

} // namespace gamehub

#endif // GAMEHUB_HUB_SNAPSHOT_HPP
