// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "cryptorand.hpp"

#include <glog/logging.h>

#include <openssl/rand.h>

namespace gamehub
{

Digest
CryptoRandomSeed ()
{
  unsigned char bytes[Digest::NUM_BYTES];
  CHECK_EQ (RAND_bytes (bytes, Digest::NUM_BYTES), 1);

  Digest res;
  res.FromBlob (bytes);

  return res;
}

} // namespace gamehub
