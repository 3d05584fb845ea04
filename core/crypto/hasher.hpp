/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/buffer_view.hpp"
#include "outcome/outcome.hpp"

namespace gorc::crypto {

  enum class HasherError {
    DIGEST_UNAVAILABLE = 1,
    DIGEST_FAILED,
  };

  class Hasher {
   protected:
    using Hash160 = common::Hash160;
    using Hash256 = common::Hash256;
    using Hash512 = common::Hash512;

   public:
    virtual ~Hasher() = default;

    /**
     * @brief sha2_256 function calculates 32-byte sha2-256 hash
     * @param data source value
     * @return 256-bit hash value
     */
    virtual Hash256 sha2_256(common::BufferView data) const = 0;

    /**
     * @brief ripemd_160 function calculates 20-byte ripemd-160 hash
     * @param data source value
     * @return 160-bit hash value, DIGEST_UNAVAILABLE when the crypto library
     * does not provide the algorithm
     */
    virtual outcome::result<Hash160> ripemd_160(
        common::BufferView data) const = 0;

    /**
     * @brief keccak_256 function calculates 32-byte keccak hash (the
     * pre-standard padding used by Ethereum, not sha3-256)
     * @param data source value
     * @return 256-bit hash value
     */
    virtual outcome::result<Hash256> keccak_256(
        common::BufferView data) const = 0;

    /**
     * @brief hmac_sha512 calculates HMAC with SHA2-512
     * @param key MAC key
     * @param data source value
     * @return 512-bit MAC, caller is responsible for wiping it when the key
     * is secret
     */
    virtual outcome::result<Hash512> hmac_sha512(
        common::BufferView key, common::BufferView data) const = 0;
  };
}  // namespace gorc::crypto

OUTCOME_HPP_DECLARE_ERROR(gorc::crypto, HasherError);
