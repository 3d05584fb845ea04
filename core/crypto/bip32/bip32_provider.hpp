/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/bip32/bip32_types.hpp"
#include "crypto/bip32/derivation_path.hpp"

namespace gorc::crypto {

  /**
   * @class Bip32Provider hierarchical deterministic derivation of secp256k1
   * private keys
   */
  class Bip32Provider {
   public:
    virtual ~Bip32Provider() = default;

    /**
     * @brief master key from seed, HMAC-SHA512 keyed with "Bitcoin seed"
     * @param seed 16 to 64 bytes
     */
    virtual outcome::result<bip32::ExtendedPrivateKey> masterKey(
        common::BufferView seed) const = 0;

    /**
     * @brief private child derivation
     * @param parent extended key to derive from
     * @param index child index, hardened if kHardenedFlag is set
     */
    virtual outcome::result<bip32::ExtendedPrivateKey> deriveChild(
        const bip32::ExtendedPrivateKey &parent, uint32_t index) const = 0;

    /**
     * @brief applies every component of \param path starting from the
     * master key of \param seed
     * @return secret key at the end of the path
     */
    virtual outcome::result<secp256k1::SecretKey> derivePath(
        common::BufferView seed, const bip32::DerivationPath &path) const = 0;
  };

}  // namespace gorc::crypto
