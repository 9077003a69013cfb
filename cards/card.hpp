// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAMEHUB_CARDS_CARD_HPP
#define GAMEHUB_CARDS_CARD_HPP

#include <ostream>
#include <string>

namespace gamehub
{

/** Suits of a standard deck, in canonical order.  */
enum class Suit
{
  CLUBS = 0,
  DIAMONDS = 1,
  HEARTS = 2,
  SPADES = 3,
};

/**
 * Ranks of a standard deck.  The numeric value is the pip value for
 * numbered cards; court cards and the ace continue the sequence.
 */
enum class Rank
{
  TWO = 2,
  THREE = 3,
  FOUR = 4,
  FIVE = 5,
  SIX = 6,
  SEVEN = 7,
  EIGHT = 8,
  NINE = 9,
  TEN = 10,
  JACK = 11,
  QUEEN = 12,
  KING = 13,
  ACE = 14,
};

/** All suits in canonical order.  */
constexpr Suit ALL_SUITS[] =
  {
    Suit::CLUBS, Suit::DIAMONDS, Suit::HEARTS, Suit::SPADES,
  };

/** All ranks in canonical order.  */
constexpr Rank ALL_RANKS[] =
  {
    Rank::TWO, Rank::THREE, Rank::FOUR, Rank::FIVE, Rank::SIX,
    Rank::SEVEN, Rank::EIGHT, Rank::NINE, Rank::TEN,
    Rank::JACK, Rank::QUEEN, Rank::KING, Rank::ACE,
  };

/**
 * A single playing card.  Cards are plain values; two cards with the same
 * suit and rank are interchangeable.
 */
class Card
{

private:

  Suit suit = Suit::CLUBS;
  Rank rank = Rank::TWO;

public:

  Card () = default;
  Card (const Card&) = default;
  Card& operator= (const Card&) = default;

  explicit Card (const Suit s, const Rank r)
    : suit(s), rank(r)
  {}

  Suit
  GetSuit () const
  {
    return suit;
  }

  Rank
  GetRank () const
  {
    return rank;
  }

  /**
   * Returns a short display string like "A♠", "10♥" or "J♦".
   */
  std::string ToString () const;

  friend bool
  operator== (const Card& a, const Card& b)
  {
    return a.suit == b.suit && a.rank == b.rank;
  }

  friend bool
  operator!= (const Card& a, const Card& b)
  {
    return !(a == b);
  }

  /** Orders by suit, then rank (the canonical deck order).  */
  friend bool
  operator< (const Card& a, const Card& b)
  {
    if (a.suit != b.suit)
      return a.suit < b.suit;
    return a.rank < b.rank;
  }

  friend std::ostream&
  operator<< (std::ostream& out, const Card& c)
  {
    return out << c.ToString ();
  }

};

} // namespace gamehub

#endif // GAMEHUB_CARDS_CARD_HPP
