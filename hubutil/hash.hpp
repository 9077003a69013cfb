// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HUBUTIL_HASH_HPP
#define HUBUTIL_HASH_HPP

#include "digest.hpp"

#include <memory>
#include <string>

namespace gamehub
{

/**
 * Incremental SHA-256 hasher, backed by OpenSSL.  Data is fed in with
 * operator<< and the digest extracted with Finalise.
 */
class SHA256
{

private:

  class State;

  /** The OpenSSL state.  Set to null after finalising.  */
  std::unique_ptr<State> state;

public:

  SHA256 ();
  ~SHA256 ();

  SHA256 (const SHA256&) = delete;
  void operator= (const SHA256&) = delete;

  SHA256& operator<< (const std::string& data);
  SHA256& operator<< (const Digest& data);

  /**
   * Returns the digest of all data.  The instance must not be used
   * any more afterwards.
   */
  Digest Finalise ();

  /**
   * Hashes a single string in one go.
   */
  static Digest Hash (const std::string& data);

};

} // namespace gamehub

#endif // HUBUTIL_HASH_HPP
