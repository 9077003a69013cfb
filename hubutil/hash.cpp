// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.hpp"

#include <glog/logging.h>

#include <openssl/evp.h>

namespace gamehub
{

/**
 * Wrapper around an OpenSSL digest context for SHA-256.
 */
class SHA256::State
{

private:

  EVP_MD_CTX* ctx;

public:

  State ()
    : ctx(EVP_MD_CTX_new ())
  {
    CHECK (ctx != nullptr);
    CHECK_EQ (EVP_DigestInit_ex (ctx, EVP_sha256 (), nullptr), 1);
  }

  ~State ()
  {
    EVP_MD_CTX_free (ctx);
  }

  State (const State&) = delete;
  void operator= (const State&) = delete;

  void
  Update (const unsigned char* data, const size_t len)
  {
    CHECK_EQ (EVP_DigestUpdate (ctx, data, len), 1);
  }

  void
  Finalise (unsigned char* out)
  {
    unsigned outLen;
    CHECK_EQ (EVP_DigestFinal_ex (ctx, out, &outLen), 1);
    CHECK_EQ (outLen, Digest::NUM_BYTES);
  }

};

SHA256::SHA256 ()
  : state(std::make_unique<State> ())
{}

SHA256::~SHA256 () = default;

SHA256&
SHA256::operator<< (const std::string& data)
{
  CHECK (state != nullptr) << "SHA256 has already been finalised";
  state->Update (reinterpret_cast<const unsigned char*> (data.data ()),
                 data.size ());
  return *this;
}

SHA256&
SHA256::operator<< (const Digest& data)
{
  CHECK (state != nullptr) << "SHA256 has already been finalised";
  state->Update (data.GetBlob (), Digest::NUM_BYTES);
  return *this;
}

Digest
SHA256::Finalise ()
{
  CHECK (state != nullptr) << "SHA256 has already been finalised";

  unsigned char bytes[Digest::NUM_BYTES];
  state->Finalise (bytes);
  state.reset ();

  Digest res;
  res.FromBlob (bytes);
  return res;
}

Digest
SHA256::Hash (const std::string& data)
{
  SHA256 hasher;
  hasher << data;
  return hasher.Finalise ();
}

} // namespace gamehub
