/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "keystore/chain_adapter.hpp"

#include "crypto/hasher.hpp"
#include "crypto/secp256k1_provider.hpp"

namespace gorc::keystore {

  /**
   * Part of the adapters that doesn't depend on the chain: both chains use
   * plain secp256k1 scalars and BIP-0044 paths
   */
  class Secp256k1Adapter : public ChainAdapter {
   public:
    crypto::bip32::DerivationPath derivationPath(
        uint32_t account_index) const override;

    bool isValidPrivateKey(
        std::span<const uint8_t, crypto::secp256k1::constants::kSecretKeySize>
            bytes) const override;

    crypto::SecureBuffer serializePrivateKey(
        const crypto::secp256k1::SecretKey &private_key) const override;

    outcome::result<crypto::secp256k1::SecretKey> deserializePrivateKey(
        const crypto::SecureBuffer &bytes) const override;

   protected:
    Secp256k1Adapter(std::shared_ptr<crypto::Hasher> hasher,
                     std::shared_ptr<crypto::Secp256k1Provider> secp256k1);

    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<crypto::Secp256k1Provider> secp256k1_;
  };

}  // namespace gorc::keystore
