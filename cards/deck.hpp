// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAMEHUB_CARDS_DECK_HPP
#define GAMEHUB_CARDS_DECK_HPP

#include "card.hpp"

#include <hubutil/random.hpp>

#include <vector>

namespace gamehub
{

/**
 * A standard 52-card deck with shuffle and draw.  Each deck belongs to a
 * single room (it is never shared) and owns the Random instance driving
 * its shuffles, so that a given seed always yields the same order.
 *
 * The last element of the stock is the top of the deck.
 */
class Deck
{

private:

  /** The remaining stock.  */
  std::vector<Card> cards;

  /** The random source for shuffles.  */
  Random rnd;

public:

  /**
   * Constructs the deck with the given (seeded) random source and
   * calls Reset.
   */
  explicit Deck (Random&& r);

  Deck (Deck&&) = default;
  Deck& operator= (Deck&&) = default;

  Deck (const Deck&) = delete;
  void operator= (const Deck&) = delete;

  /**
   * Returns the number of cards remaining.
   */
  size_t
  GetCount () const
  {
    return cards.size ();
  }

  /**
   * Returns the remaining stock, bottom first.
   */
  const std::vector<Card>&
  GetCards () const
  {
    return cards;
  }

  /**
   * Rebuilds the full 52 cards in canonical order (suit-major) and
   * shuffles them.
   */
  void Reset ();

  /**
   * Shuffles the remaining stock in place.
   */
  void Shuffle ();

  /**
   * Removes the top card and returns it in the out argument.  Returns false
   * (leaving the argument untouched) if the deck is empty.
   */
  bool TryDraw (Card& card);

  /**
   * Draws up to n cards one at a time from the top.  If the deck runs out,
   * fewer cards are returned.
   */
  std::vector<Card> DrawMany (size_t n);

};

} // namespace gamehub

#endif // GAMEHUB_CARDS_DECK_HPP
