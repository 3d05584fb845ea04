/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/secp256k1_types.hpp"
#include "outcome/outcome.hpp"

namespace gorc::crypto {

  /**
   * @class Secp256k1Provider provides scalar and point operations on the
   * secp256k1 curve
   */
  class Secp256k1Provider {
   public:
    virtual ~Secp256k1Provider() = default;

    /**
     * @brief checks that \param secret is a non-zero scalar below the curve
     * order
     */
    virtual bool isValidSecretKey(
        std::span<const uint8_t, secp256k1::constants::kSecretKeySize> secret)
        const = 0;

    /**
     * @brief checks that \param public_key is a serialized point on the curve
     * (either compressed or uncompressed form)
     */
    virtual bool isValidPublicKey(common::BufferView public_key) const = 0;

    /**
     * @brief derive public key in compressed form
     * @param secret_key secret key
     * @return compressed public key or error
     */
    virtual outcome::result<secp256k1::CompressedPublicKey>
    derivePublicKeyCompressed(const secp256k1::SecretKey &secret_key) const = 0;

    /**
     * @brief derive public key in uncompressed form
     * @param secret_key secret key
     * @return uncompressed public key or error
     */
    virtual outcome::result<secp256k1::UncompressedPublicKey>
    derivePublicKeyUncompressed(
        const secp256k1::SecretKey &secret_key) const = 0;

    /**
     * @brief adds \param tweak to \param secret_key modulo the curve order
     * @return new secret key, or error if the tweak is out of range or the
     * result is zero
     */
    virtual outcome::result<secp256k1::SecretKey> tweakAdd(
        const secp256k1::SecretKey &secret_key,
        const secp256k1::Tweak &tweak) const = 0;
  };

}  // namespace gorc::crypto
