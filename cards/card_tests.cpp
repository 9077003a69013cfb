// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "card.hpp"

#include <gtest/gtest.h>

namespace gamehub
{
namespace
{

using CardTests = testing::Test;

TEST_F (CardTests, ToString)
{
  EXPECT_EQ (Card (Suit::SPADES, Rank::ACE).ToString (), "A♠");
  EXPECT_EQ (Card (Suit::HEARTS, Rank::TEN).ToString (), "10♥");
  EXPECT_EQ (Card (Suit::DIAMONDS, Rank::JACK).ToString (), "J♦");
  EXPECT_EQ (Card (Suit::CLUBS, Rank::TWO).ToString (), "2♣");
  EXPECT_EQ (Card (Suit::CLUBS, Rank::QUEEN).ToString (), "Q♣");
  EXPECT_EQ (Card (Suit::HEARTS, Rank::KING).ToString (), "K♥");
}

TEST_F (CardTests, ValueSemantics)
{
  const Card a(Suit::HEARTS, Rank::SEVEN);
  Card b(Suit::CLUBS, Rank::ACE);
  EXPECT_NE (a, b);

  b = a;
  EXPECT_EQ (a, b);
  EXPECT_EQ (b.GetSuit (), Suit::HEARTS);
  EXPECT_EQ (b.GetRank (), Rank::SEVEN);
}

TEST_F (CardTests, CanonicalOrdering)
{
  EXPECT_TRUE (Card (Suit::CLUBS, Rank::ACE) < Card (Suit::DIAMONDS, Rank::TWO));
  EXPECT_TRUE (Card (Suit::SPADES, Rank::TWO) < Card (Suit::SPADES, Rank::THREE));
  EXPECT_FALSE (Card (Suit::SPADES, Rank::TWO) < Card (Suit::SPADES, Rank::TWO));
}

TEST_F (CardTests, RankValues)
{
  EXPECT_EQ (static_cast<int> (Rank::TWO), 2);
  EXPECT_EQ (static_cast<int> (Rank::TEN), 10);
  EXPECT_EQ (static_cast<int> (Rank::ACE), 14);
}

} // anonymous namespace
} // namespace gamehub
