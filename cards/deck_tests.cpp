// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "deck.hpp"

#include <hubutil/hash.hpp>

#include <gtest/gtest.h>

#include <set>

namespace gamehub
{
namespace
{

/**
 * Returns a Random instance seeded from the given string.
 */
Random
SeededRandom (const std::string& seed)
{
  Random res;
  res.Seed (SHA256::Hash (seed));
  return res;
}

class DeckTests : public testing::Test
{

protected:

  Deck deck;

  DeckTests ()
    : deck(SeededRandom ("deck test"))
  {}

};

TEST_F (DeckTests, ResetYieldsCanonicalSet)
{
  ASSERT_EQ (deck.GetCount (), 52);

  std::set<Card> expected;
  for (const auto s : ALL_SUITS)
    for (const auto r : ALL_RANKS)
      expected.insert (Card (s, r));

  const std::set<Card> actual(deck.GetCards ().begin (),
                              deck.GetCards ().end ());
  EXPECT_EQ (actual.size (), 52);
  EXPECT_EQ (actual, expected);
}

TEST_F (DeckTests, ResetShuffles)
{
  std::vector<Card> canonical;
  for (const auto s : ALL_SUITS)
    for (const auto r : ALL_RANKS)
      canonical.emplace_back (s, r);

  EXPECT_NE (deck.GetCards (), canonical);
}

TEST_F (DeckTests, ResetRestoresFullDeck)
{
  deck.DrawMany (20);
  ASSERT_EQ (deck.GetCount (), 32);

  deck.Reset ();
  EXPECT_EQ (deck.GetCount (), 52);
}

TEST_F (DeckTests, DrawAllThenFail)
{
  std::set<Card> drawn;
  for (unsigned i = 0; i < 52; ++i)
    {
      Card c;
      ASSERT_TRUE (deck.TryDraw (c));
      drawn.insert (c);
      EXPECT_EQ (deck.GetCount (), 51 - i);
    }
  EXPECT_EQ (drawn.size (), 52);

  const Card marker(Suit::HEARTS, Rank::QUEEN);
  Card c = marker;
  EXPECT_FALSE (deck.TryDraw (c));
  EXPECT_EQ (c, marker);
  EXPECT_EQ (deck.GetCount (), 0);
}

TEST_F (DeckTests, DrawTakesFromTop)
{
  const Card top = deck.GetCards ().back ();

  Card c;
  ASSERT_TRUE (deck.TryDraw (c));
  EXPECT_EQ (c, top);
}

TEST_F (DeckTests, DrawManyStopsWhenEmpty)
{
  const auto cards = deck.DrawMany (60);
  EXPECT_EQ (cards.size (), 52);
  EXPECT_EQ (deck.GetCount (), 0);

  EXPECT_TRUE (deck.DrawMany (3).empty ());
}

TEST_F (DeckTests, DrawManyPartial)
{
  const auto cards = deck.DrawMany (5);
  EXPECT_EQ (cards.size (), 5);
  EXPECT_EQ (deck.GetCount (), 47);
}

TEST_F (DeckTests, GoldenOrder)
{
  /* The exact order is fixed by the seed and the Fisher-Yates pass, so any
     change to either shows up here.  */
  const std::vector<Card> expected =
    {
      Card (Suit::HEARTS, Rank::KING),
      Card (Suit::HEARTS, Rank::EIGHT),
      Card (Suit::CLUBS, Rank::KING),
      Card (Suit::SPADES, Rank::FIVE),
      Card (Suit::SPADES, Rank::JACK),
    };

  EXPECT_EQ (deck.DrawMany (5), expected);
}

TEST_F (DeckTests, SameSeedSameOrder)
{
  Deck other(SeededRandom ("deck test"));
  EXPECT_EQ (other.GetCards (), deck.GetCards ());

  Deck different(SeededRandom ("other seed"));
  EXPECT_NE (different.GetCards (), deck.GetCards ());
}

TEST (DeckConstructionTests, UnseededRandom)
{
  EXPECT_DEATH (
    {
      Deck d{Random ()};
    }, "seeded random source");
}

} // anonymous namespace
} // namespace gamehub
