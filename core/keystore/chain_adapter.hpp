/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "common/buffer.hpp"
#include "crypto/bip32/derivation_path.hpp"
#include "crypto/secp256k1_types.hpp"
#include "keystore/chain.hpp"

namespace gorc::keystore {

  enum class ChainAdapterError {
    INVALID_PUBLIC_KEY = 1,
    INVALID_PRIVATE_KEY,
  };

  /**
   * @class ChainAdapter turns chain agnostic secp256k1 keys into the public
   * key and address forms a particular chain uses
   */
  class ChainAdapter {
   public:
    virtual ~ChainAdapter() = default;

    virtual Chain chain() const = 0;

    /// SLIP-0044 coin type
    virtual uint32_t coinType() const = 0;

    /**
     * @return BIP-0044 path m/44'/coin'/account'/0/0
     */
    virtual crypto::bip32::DerivationPath derivationPath(
        uint32_t account_index) const = 0;

    /**
     * @return whether \param bytes is a usable secret scalar
     */
    virtual bool isValidPrivateKey(
        std::span<const uint8_t, crypto::secp256k1::constants::kSecretKeySize>
            bytes) const = 0;

    /**
     * @return public key serialized the way the chain expects it
     */
    virtual outcome::result<common::Buffer> publicKeyFromPrivate(
        const crypto::secp256k1::SecretKey &private_key) const = 0;

    /**
     * @return chain-native address of \param public_key, or
     * INVALID_PUBLIC_KEY for wrong length or a point not on the curve
     */
    virtual outcome::result<std::string> addressFromPublicKey(
        common::BufferView public_key) const = 0;

    /**
     * @return canonical 32-byte big-endian form of the scalar, the only form
     * that is ever encrypted
     */
    virtual crypto::SecureBuffer serializePrivateKey(
        const crypto::secp256k1::SecretKey &private_key) const = 0;

    /**
     * @return scalar from its canonical form, INVALID_PRIVATE_KEY for a wrong
     * length or an out of range value
     */
    virtual outcome::result<crypto::secp256k1::SecretKey>
    deserializePrivateKey(const crypto::SecureBuffer &bytes) const = 0;
  };

}  // namespace gorc::keystore

OUTCOME_HPP_DECLARE_ERROR(gorc::keystore, ChainAdapterError);
