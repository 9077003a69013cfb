// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HUBUTIL_CRYPTORAND_HPP
#define HUBUTIL_CRYPTORAND_HPP

#include "digest.hpp"

namespace gamehub
{

/**
 * Returns a fresh seed from OpenSSL's secure random generator.  This is
 * used when no fixed seed is configured, so that live rooms do not share
 * predictable shuffles.
 */
Digest CryptoRandomSeed ();

} // namespace gamehub

#endif // HUBUTIL_CRYPTORAND_HPP
