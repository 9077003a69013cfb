// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "engine.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace blackjack
{

int
ComputeHandValue (const std::vector<Card>& hand)
{
  int total = 0;
  unsigned softAces = 0;

  for (const auto& c : hand)
    {
      const int rank = static_cast<int> (c.GetRank ());
      switch (c.GetRank ())
        {
        case gamehub::Rank::ACE:
          ++softAces;
          total += 11;
          break;
        case gamehub::Rank::JACK:
        case gamehub::Rank::QUEEN:
        case gamehub::Rank::KING:
          total += 10;
          break;
        default:
          total += rank;
          break;
        }
    }

  while (total > BLACKJACK_TOTAL && softAces > 0)
    {
      total -= 10;
      --softAces;
    }

  return total;
}

namespace
{

/**
 * Returns true if the hand is a natural blackjack (21 with two cards).
 */
bool
IsNatural (const std::vector<Card>& hand)
{
  return hand.size () == 2 && ComputeHandValue (hand) == BLACKJACK_TOTAL;
}

} // anonymous namespace

BlackjackEngine::BlackjackEngine (gamehub::Random&& rnd)
  : deck(std::move (rnd))
{}

PlayerId
BlackjackEngine::GetCurrentPlayer () const
{
  if (phase != Phase::PLAYER_TURNS || currentIndex < 0)
    return "";

  CHECK_LT (currentIndex, static_cast<int> (players.size ()));
  return players[currentIndex].id;
}

bool
BlackjackEngine::IsDealerRevealed () const
{
  return phase == Phase::DEALER_TURN || phase == Phase::ROUND_RESULTS;
}

void
BlackjackEngine::EnsurePlayer (const PlayerId& id)
{
  CHECK (!id.empty ());

  for (const auto& p : players)
    if (p.id == id)
      return;

  players.emplace_back (id);
  VLOG (1) << "Blackjack player added: " << id;
}

void
BlackjackEngine::RemovePlayer (const PlayerId& id)
{
  auto mit = std::find_if (players.begin (), players.end (),
                           [&id] (const PlayerState& p)
                             {
                               return p.id == id;
                             });
  if (mit == players.end ())
    return;

  const int index = mit - players.begin ();
  players.erase (mit);
  VLOG (1) << "Blackjack player removed: " << id;

  if (players.empty ())
    {
      LOG (INFO) << "Last blackjack player left, back to the lobby";
      phase = Phase::LOBBY;
      dealerHand.clear ();
      currentIndex = -1;
      return;
    }

  if (phase != Phase::PLAYER_TURNS)
    return;

  if (index < currentIndex)
    --currentIndex;
  else if (index == currentIndex)
    AdvanceTurn (currentIndex - 1);
}

int
BlackjackEngine::FindNextActive (const int after) const
{
  for (int i = after + 1; i < static_cast<int> (players.size ()); ++i)
    if (players[i].IsActive ())
      return i;

  return -1;
}

void
BlackjackEngine::AdvanceTurn (const int after)
{
  currentIndex = FindNextActive (after);
  if (currentIndex < 0)
    PlayDealer ();
}

bool
BlackjackEngine::StartRound ()
{
  switch (phase)
    {
    case Phase::LOBBY:
    case Phase::ROUND_RESULTS:
      break;
    default:
      LOG (WARNING) << "Cannot start a blackjack round in the middle of one";
      return false;
    }

  if (players.empty ())
    {
      LOG (WARNING) << "Cannot start a blackjack round without players";
      return false;
    }

  phase = Phase::DEALING;
  deck.Reset ();

  dealerHand.clear ();
  for (auto& p : players)
    {
      p.hand.clear ();
      p.inRound = true;
      p.stood = false;
      p.bust = false;
      p.result = Result::PENDING;
      p.bet = 1;
    }

  /* Two rounds of one card to each player, then one to the dealer.  */
  for (unsigned i = 0; i < 2; ++i)
    {
      Card c;
      for (auto& p : players)
        if (deck.TryDraw (c))
          p.hand.push_back (c);
      if (deck.TryDraw (c))
        dealerHand.push_back (c);
    }

  LOG (INFO) << "Dealt a blackjack round to " << players.size () << " players";

  phase = Phase::PLAYER_TURNS;
  AdvanceTurn (-1);

  return true;
}

bool
BlackjackEngine::ApplyAction (const PlayerId& id, const Action a)
{
  if (phase != Phase::PLAYER_TURNS)
    {
      LOG (WARNING) << "Blackjack action outside of player turns by " << id;
      return false;
    }

  if (id.empty () || id != GetCurrentPlayer ())
    {
      LOG (WARNING) << "Not the blackjack turn of " << id;
      return false;
    }

  auto& p = players[currentIndex];
  CHECK (p.IsActive ());

  switch (a)
    {
    case Action::HIT:
      {
        Card c;
        if (!deck.TryDraw (c))
          {
            LOG (WARNING) << "Deck is empty, cannot hit";
            return false;
          }
        p.hand.push_back (c);
        VLOG (1) << id << " draws " << c;
        if (ComputeHandValue (p.hand) > BLACKJACK_TOTAL)
          {
            VLOG (1) << id << " is bust";
            p.bust = true;
          }
        break;
      }

    case Action::STAND:
      VLOG (1) << id << " stands";
      p.stood = true;
      break;

    default:
      LOG (FATAL) << "Invalid blackjack action: " << static_cast<int> (a);
    }

  if (!p.IsActive ())
    AdvanceTurn (currentIndex);

  return true;
}

void
BlackjackEngine::PlayDealer ()
{
  phase = Phase::DEALER_TURN;
  currentIndex = -1;

  while (ComputeHandValue (dealerHand) < DEALER_STANDS_AT)
    {
      Card c;
      if (!deck.TryDraw (c))
        break;
      dealerHand.push_back (c);
    }

  ComputeResults ();
  phase = Phase::ROUND_RESULTS;
}

void
BlackjackEngine::ComputeResults ()
{
  const int dealerValue = ComputeHandValue (dealerHand);
  const bool dealerBust = dealerValue > BLACKJACK_TOTAL;

  for (auto& p : players)
    {
      if (!p.inRound)
        {
          p.result = Result::PENDING;
          continue;
        }

      const int value = ComputeHandValue (p.hand);
      if (p.bust)
        p.result = Result::LOSE;
      else if (IsNatural (p.hand))
        p.result = IsNatural (dealerHand) ? Result::PUSH : Result::BLACKJACK;
      else if (dealerBust || value > dealerValue)
        p.result = Result::WIN;
      else if (value < dealerValue)
        p.result = Result::LOSE;
      else
        p.result = Result::PUSH;

      switch (p.result)
        {
        case Result::WIN:
        case Result::BLACKJACK:
          p.chips += p.bet;
          break;
        case Result::LOSE:
          p.chips -= p.bet;
          break;
        default:
          break;
        }
    }

  LOG (INFO) << "Blackjack round settled, dealer has " << dealerValue;
}

} // namespace blackjack
