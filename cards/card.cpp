// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "card.hpp"

#include <glog/logging.h>

namespace gamehub
{

namespace
{

std::string
RankText (const Rank r)
{
  switch (r)
    {
    case Rank::JACK:
      return "J";
    case Rank::QUEEN:
      return "Q";
    case Rank::KING:
      return "K";
    case Rank::ACE:
      return "A";
    default:
      return std::to_string (static_cast<int> (r));
    }
}

std::string
SuitText (const Suit s)
{
  switch (s)
    {
    case Suit::CLUBS:
      return "♣";
    case Suit::DIAMONDS:
      return "♦";
    case Suit::HEARTS:
      return "♥";
    case Suit::SPADES:
      return "♠";
    }

  LOG (FATAL) << "Invalid suit: " << static_cast<int> (s);
}

} // anonymous namespace

std::string
Card::ToString () const
{
  return RankText (rank) + SuitText (suit);
}

} // namespace gamehub
