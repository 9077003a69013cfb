// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "random.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <glog/logging.h>

#include <algorithm>
#include <map>
#include <vector>

namespace gamehub
{
namespace
{

/** The seed (as hex string) that we use in tests.  */
constexpr const char SEED[]
    = "7ca22c1665349f6c2cf40c7f7923e18184bbf3baa2b4096bee511b7a7eaf87e8";

class RandomTests : public testing::Test
{

protected:

  Random rnd;

  RandomTests ()
  {
    Digest seed;
    CHECK (seed.FromHex (SEED));
    rnd.Seed (seed);
  }

};

TEST_F (RandomTests, Bytes)
{
  const unsigned char expectedBytes[] = {
    /* The seed itself.  */
    0x7c, 0xa2, 0x2c, 0x16, 0x65, 0x34, 0x9f, 0x6c,
    0x2c, 0xf4, 0x0c, 0x7f, 0x79, 0x23, 0xe1, 0x81,
    0x84, 0xbb, 0xf3, 0xba, 0xa2, 0xb4, 0x09, 0x6b,
    0xee, 0x51, 0x1b, 0x7a, 0x7e, 0xaf, 0x87, 0xe8,

    /* The start of its hash.  */
    0x67, 0xd8, 0x11, 0xd6, 0x7f, 0xfb, 0x76, 0x45,
  };

  for (const auto b : expectedBytes)
    ASSERT_EQ (rnd.Next<unsigned char> (), b);
}

TEST_F (RandomTests, Integers)
{
  EXPECT_EQ (rnd.Next<uint16_t> (), 0x7ca2);
  EXPECT_EQ (rnd.Next<uint32_t> (), 0x2c166534);
}

TEST_F (RandomTests, NextIntRange)
{
  std::map<uint32_t, unsigned> counts;
  for (unsigned i = 0; i < 1000; ++i)
    {
      const uint32_t val = rnd.NextInt (5);
      ASSERT_LT (val, 5);
      ++counts[val];
    }

  EXPECT_EQ (counts.size (), 5);
  for (const auto& entry : counts)
    EXPECT_GT (entry.second, 100);
}

TEST_F (RandomTests, SameSeedSameStream)
{
  Digest seed;
  ASSERT_TRUE (seed.FromHex (SEED));
  Random other;
  other.Seed (seed);

  for (unsigned i = 0; i < 100; ++i)
    ASSERT_EQ (rnd.NextInt (1000), other.NextInt (1000));
}

TEST_F (RandomTests, BranchOff)
{
  Random a = rnd.BranchOff ("room A");
  Random a2 = rnd.BranchOff ("room A");
  Random b = rnd.BranchOff ("room B");

  std::vector<uint64_t> seqA, seqA2, seqB;
  for (unsigned i = 0; i < 10; ++i)
    {
      seqA.push_back (a.Next<uint64_t> ());
      seqA2.push_back (a2.Next<uint64_t> ());
      seqB.push_back (b.Next<uint64_t> ());
    }

  EXPECT_EQ (seqA, seqA2);
  EXPECT_NE (seqA, seqB);

  /* Branching does not consume from the parent stream.  */
  EXPECT_EQ (rnd.Next<unsigned char> (), 0x7c);
}

TEST_F (RandomTests, MoveLeavesSourceUnseeded)
{
  Random other = std::move (rnd);
  EXPECT_TRUE (other.IsSeeded ());
  EXPECT_FALSE (rnd.IsSeeded ());
  EXPECT_DEATH (rnd.Next<bool> (), "has not been seeded");
}

TEST_F (RandomTests, ShuffleIsPermutation)
{
  std::vector<int> values;
  for (int i = 0; i < 52; ++i)
    values.push_back (i);

  std::vector<int> shuffled = values;
  rnd.Shuffle (shuffled.begin (), shuffled.end ());
  EXPECT_NE (shuffled, values);

  std::sort (shuffled.begin (), shuffled.end ());
  EXPECT_EQ (shuffled, values);
}

TEST_F (RandomTests, ShuffleTrivialRanges)
{
  std::vector<int> empty;
  rnd.Shuffle (empty.begin (), empty.end ());
  EXPECT_TRUE (empty.empty ());

  std::vector<int> single = {42};
  rnd.Shuffle (single.begin (), single.end ());
  EXPECT_THAT (single, testing::ElementsAre (42));
}

TEST (RandomUnseededTests, SeedWithNull)
{
  Random rnd;
  Digest null;
  null.SetNull ();
  EXPECT_DEATH (rnd.Seed (null), "null value");
}

} // anonymous namespace
} // namespace gamehub
