/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "keystore/adapters/secp256k1_adapter.hpp"

#include <boost/assert.hpp>

namespace gorc::keystore {

  Secp256k1Adapter::Secp256k1Adapter(
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<crypto::Secp256k1Provider> secp256k1)
      : hasher_{std::move(hasher)}, secp256k1_{std::move(secp256k1)} {
    BOOST_ASSERT(hasher_ != nullptr);
    BOOST_ASSERT(secp256k1_ != nullptr);
  }

  crypto::bip32::DerivationPath Secp256k1Adapter::derivationPath(
      uint32_t account_index) const {
    return crypto::bip32::DerivationPath::bip44(coinType(), account_index);
  }

  bool Secp256k1Adapter::isValidPrivateKey(
      std::span<const uint8_t, crypto::secp256k1::constants::kSecretKeySize>
          bytes) const {
    return secp256k1_->isValidSecretKey(bytes);
  }

  crypto::SecureBuffer Secp256k1Adapter::serializePrivateKey(
      const crypto::secp256k1::SecretKey &private_key) const {
    crypto::SecureBuffer out;
    out.put(common::BufferView{private_key.unsafeBytes()});
    return out;
  }

  outcome::result<crypto::secp256k1::SecretKey>
  Secp256k1Adapter::deserializePrivateKey(
      const crypto::SecureBuffer &bytes) const {
    if (bytes.size() != crypto::secp256k1::constants::kSecretKeySize) {
      return ChainAdapterError::INVALID_PRIVATE_KEY;
    }
    std::span<const uint8_t, crypto::secp256k1::constants::kSecretKeySize>
        scalar{bytes.data(), crypto::secp256k1::constants::kSecretKeySize};
    if (not secp256k1_->isValidSecretKey(scalar)) {
      return ChainAdapterError::INVALID_PRIVATE_KEY;
    }
    return crypto::secp256k1::SecretKey::from(bytes);
  }

}  // namespace gorc::keystore
