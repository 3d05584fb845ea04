/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include <memory>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "crypto/sha/sha256.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(gorc::crypto, HasherError, e) {
  using E = gorc::crypto::HasherError;
  switch (e) {
    case E::DIGEST_UNAVAILABLE:
      return "digest algorithm is not provided by the crypto library";
    case E::DIGEST_FAILED:
      return "digest computation failed";
  }
  return "unknown HasherError";
}

namespace gorc::crypto {
  using common::Hash160;
  using common::Hash256;
  using common::Hash512;

  namespace {
    struct MdDeleter {
      void operator()(EVP_MD *md) const {
        EVP_MD_free(md);
      }
    };
    using FetchedMd = std::unique_ptr<EVP_MD, MdDeleter>;

    /// one-shot digest of an algorithm fetched from the default providers
    template <size_t N>
    outcome::result<common::Blob<N>> fetchedDigest(const char *algorithm,
                                                   common::BufferView data) {
      FetchedMd md{EVP_MD_fetch(nullptr, algorithm, nullptr)};
      if (md == nullptr) {
        return HasherError::DIGEST_UNAVAILABLE;
      }
      if (static_cast<size_t>(EVP_MD_get_size(md.get())) != N) {
        return HasherError::DIGEST_FAILED;
      }
      common::Blob<N> out;
      unsigned int out_len = 0;
      if (1
          != EVP_Digest(data.data(),
                        data.size(),
                        out.data(),
                        &out_len,
                        md.get(),
                        nullptr)) {
        return HasherError::DIGEST_FAILED;
      }
      return out;
    }
  }  // namespace

  Hash256 HasherImpl::sha2_256(common::BufferView data) const {
    return sha256(data);
  }

  outcome::result<Hash160> HasherImpl::ripemd_160(
      common::BufferView data) const {
    return fetchedDigest<Hash160::size()>("RIPEMD-160", data);
  }

  outcome::result<Hash256> HasherImpl::keccak_256(
      common::BufferView data) const {
    return fetchedDigest<Hash256::size()>("KECCAK-256", data);
  }

  outcome::result<Hash512> HasherImpl::hmac_sha512(
      common::BufferView key, common::BufferView data) const {
    Hash512 out;
    unsigned int out_len = 0;
    if (nullptr
        == HMAC(EVP_sha512(),
                key.data(),
                static_cast<int>(key.size()),
                data.data(),
                data.size(),
                out.data(),
                &out_len)) {
      return HasherError::DIGEST_FAILED;
    }
    return out;
  }

}  // namespace gorc::crypto
