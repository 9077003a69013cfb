// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "snapshot.hpp"

#include <glog/logging.h>

namespace gamehub
{

namespace
{

void
SetCoord (const Coord& c, proto::Coord& pb)
{
  pb.set_row (c.GetRow ());
  pb.set_column (c.GetColumn ());
}

void
SetCard (const Card& c, proto::Card& pb)
{
  pb.set_suit (static_cast<uint32_t> (c.GetSuit ()));
  pb.set_rank (static_cast<uint32_t> (c.GetRank ()));
}

proto::TicTacToeState::Mark
MarkToProto (const tictactoe::Mark m)
{
  switch (m)
    {
    case tictactoe::Mark::NONE:
      return proto::TicTacToeState::NONE;
    case tictactoe::Mark::X:
      return proto::TicTacToeState::X;
    case tictactoe::Mark::O:
      return proto::TicTacToeState::O;
    }

  LOG (FATAL) << "Invalid mark: " << static_cast<int> (m);
}

proto::CheckersState::Piece
PieceToProto (const checkers::Piece p)
{
  switch (p)
    {
    case checkers::Piece::EMPTY:
      return proto::CheckersState::EMPTY;
    case checkers::Piece::RED_MAN:
      return proto::CheckersState::RED_MAN;
    case checkers::Piece::RED_KING:
      return proto::CheckersState::RED_KING;
    case checkers::Piece::BLACK_MAN:
      return proto::CheckersState::BLACK_MAN;
    case checkers::Piece::BLACK_KING:
      return proto::CheckersState::BLACK_KING;
    }

  LOG (FATAL) << "Invalid piece: " << static_cast<int> (p);
}

proto::CheckersState::Phase
CheckersPhaseToProto (const checkers::Phase p)
{
  switch (p)
    {
    case checkers::Phase::NOT_STARTED:
      return proto::CheckersState::NOT_STARTED;
    case checkers::Phase::ACTIVE:
      return proto::CheckersState::ACTIVE;
    case checkers::Phase::GAME_OVER:
      return proto::CheckersState::GAME_OVER;
    }

  LOG (FATAL) << "Invalid checkers phase: " << static_cast<int> (p);
}

} // anonymous namespace

proto::TicTacToeState
TicTacToeToProto (const tictactoe::TicTacToeRoomState& state)
{
  proto::TicTacToeState res;

  for (const auto m : state.GetCells ())
    res.add_cells (MarkToProto (m));

  if (!state.GetPlayerX ().empty ())
    res.set_player_x (state.GetPlayerX ());
  if (!state.GetPlayerO ().empty ())
    res.set_player_o (state.GetPlayerO ());
  if (state.IsReady () && !state.IsGameOver ())
    res.set_current_player (state.GetCurrentPlayer ());

  res.set_game_over (state.IsGameOver ());
  if (!state.GetWinner ().empty ())
    res.set_winner (state.GetWinner ());
  res.set_draw (state.IsDraw ());
  res.set_move_count (state.GetMoveCount ());
  res.set_status (state.GetStatusMessage ());

  return res;
}

proto::CheckersState
CheckersToProto (const checkers::CheckersRoomState& state)
{
  proto::CheckersState res;

  if (state.IsStarted ())
    for (const auto& c : state.GetBoard ().AllCells ())
      res.add_cells (PieceToProto (state.GetPiece (c)));

  if (!state.GetRedPlayer ().empty ())
    res.set_red_player (state.GetRedPlayer ());
  if (!state.GetBlackPlayer ().empty ())
    res.set_black_player (state.GetBlackPlayer ());
  res.set_phase (CheckersPhaseToProto (state.GetPhase ()));
  if (!state.GetCurrentPlayer ().empty ())
    res.set_current_player (state.GetCurrentPlayer ());
  if (!state.GetWinner ().empty ())
    res.set_winner (state.GetWinner ());

  if (state.GetForced ())
    SetCoord (*state.GetForced (), *res.mutable_forced ());
  if (state.GetLastMove ())
    {
      SetCoord (state.GetLastMove ()->from, *res.mutable_last_from ());
      SetCoord (state.GetLastMove ()->to, *res.mutable_last_to ());
    }

  res.set_move_number (state.GetMoveNumber ());
  res.set_status (state.GetStatusMessage ());

  return res;
}

proto::BlackjackState
BlackjackToProto (const blackjack::BlackjackRoomState& state)
{
  const blackjack::Engine& engine = state.GetEngine ();
  proto::BlackjackState res;

  res.set_phase (static_cast<proto::BlackjackState::Phase> (
      engine.GetPhase ()));
  res.set_game_started (state.IsGameStarted ());

  for (const auto& s : state.GetSeats ())
    res.add_seats (s);

  const PlayerId current = engine.GetCurrentPlayer ();
  if (!current.empty ())
    res.set_current_player (current);

  for (const auto& p : engine.GetPlayers ())
    {
      auto* pb = res.add_players ();
      pb->set_id (p.id);

      int seat;
      if (!state.TryGetSeatIndex (p.id, seat))
        seat = -1;
      pb->set_seat (seat);

      pb->set_in_round (p.inRound);
      pb->set_stood (p.stood);
      pb->set_bust (p.bust);
      pb->set_chips (p.chips);
      pb->set_bet (p.bet);
      pb->set_result (static_cast<proto::BlackjackState::Result> (p.result));
      for (const auto& c : p.hand)
        SetCard (c, *pb->add_hand ());
      pb->set_hand_value (blackjack::ComputeHandValue (p.hand));
      pb->set_current_turn (p.id == current);
    }

  const auto& dealer = engine.GetDealerHand ();
  const bool revealed = engine.IsDealerRevealed ();
  for (size_t i = 0; i < dealer.size (); ++i)
    {
      auto* pb = res.add_dealer_hand ();
      if (i == 1 && !revealed)
        pb->set_face_down (true);
      else
        SetCard (dealer[i], *pb);
    }
  if (revealed)
    res.set_dealer_value (blackjack::ComputeHandValue (dealer));

  return res;
}

proto::RoomSnapshot
RoomToProto (const Room& room)
{
  proto::RoomSnapshot res;
  res.set_room_code (room.GetCode ());
  for (const auto& m : room.GetMembers ())
    res.add_members (m);

  const RoomVariant& state = room.GetVariant ();
  if (const auto* ttt = std::get_if<tictactoe::TicTacToeRoomState> (&state))
    *res.mutable_tictactoe () = TicTacToeToProto (*ttt);
  else if (const auto* ch = std::get_if<checkers::CheckersRoomState> (&state))
    *res.mutable_checkers () = CheckersToProto (*ch);
  else if (const auto* bj
              = std::get_if<blackjack::BlackjackRoomState> (&state))
    *res.mutable_blackjack () = BlackjackToProto (*bj);
  else
    LOG (FATAL) << "Room variant holds no state";

  return res;
}

} // namespace gamehub
