// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.hpp"

#include <gtest/gtest.h>

namespace gamehub
{
namespace
{

class SHA256Tests : public testing::Test
{

protected:

  SHA256 hasher;

};

TEST_F (SHA256Tests, Empty)
{
  EXPECT_EQ (hasher.Finalise ().ToHex (),
     "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F (SHA256Tests, MixedInput)
{
  Digest someData;
  ASSERT_TRUE (someData.FromHex (
      "7ca22c1665349f6c2cf40c7f7923e18184bbf3baa2b4096bee511b7a7eaf87e8"));

  hasher << "foo" << "" << someData << "bar";

  EXPECT_EQ (hasher.Finalise ().ToHex (),
      "b4181f2af34e16b72573aa736d848ce60fb1242df6f9f0ae8b144faf2d42e726");
}

TEST_F (SHA256Tests, UseAfterFinalise)
{
  hasher.Finalise ();
  EXPECT_DEATH (hasher << "foo", "already been finalised");
}

TEST (SHA256HashTests, UtilityHash)
{
  EXPECT_EQ (SHA256::Hash ("foobar").ToHex (),
      "c3ab8ff13720e8ad9047dd39466b3c8974e592c2fa383d4a3960714caef0c4f2");
}

TEST (DigestTests, HexRoundTrip)
{
  const std::string hex
      = "00ff10a0000000000000000000000000000000000000000000000000000000ab";

  Digest d;
  ASSERT_TRUE (d.FromHex (hex));
  EXPECT_EQ (d.ToHex (), hex);
  EXPECT_FALSE (d.IsNull ());

  d.SetNull ();
  EXPECT_TRUE (d.IsNull ());
}

TEST (DigestTests, InvalidHex)
{
  Digest d;
  EXPECT_FALSE (d.FromHex (""));
  EXPECT_FALSE (d.FromHex ("00"));
  EXPECT_FALSE (d.FromHex (
      "x0ff10a0000000000000000000000000000000000000000000000000000000ab"));
}

} // anonymous namespace
} // namespace gamehub
