// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "deck.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace gamehub
{

Deck::Deck (Random&& r)
  : rnd(std::move (r))
{
  CHECK (rnd.IsSeeded ()) << "Deck needs a seeded random source";
  Reset ();
}

void
Deck::Reset ()
{
  cards.clear ();
  for (const auto s : ALL_SUITS)
    for (const auto r : ALL_RANKS)
      cards.emplace_back (s, r);
  CHECK_EQ (cards.size (), 52);

  Shuffle ();
}

void
Deck::Shuffle ()
{
  rnd.Shuffle (cards.begin (), cards.end ());
}

bool
Deck::TryDraw (Card& card)
{
  if (cards.empty ())
    {
      VLOG (1) << "Draw from empty deck";
      return false;
    }

  card = cards.back ();
  cards.pop_back ();
  return true;
}

std::vector<Card>
Deck::DrawMany (const size_t n)
{
  std::vector<Card> res;
  res.reserve (std::min (n, cards.size ()));

  Card c;
  while (res.size () < n && TryDraw (c))
    res.push_back (c);

  return res;
}

} // namespace gamehub
