/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "keystore/adapters/cosmos_adapter.hpp"

#include "crypto/bech32/bech32.hpp"

namespace gorc::keystore {

  CosmosAdapter::CosmosAdapter(
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<crypto::Secp256k1Provider> secp256k1,
      std::string prefix)
      : Secp256k1Adapter{std::move(hasher), std::move(secp256k1)},
        prefix_{std::move(prefix)} {}

  Chain CosmosAdapter::chain() const {
    return Chain::Cosmos;
  }

  uint32_t CosmosAdapter::coinType() const {
    return kCoinType;
  }

  outcome::result<common::Buffer> CosmosAdapter::publicKeyFromPrivate(
      const crypto::secp256k1::SecretKey &private_key) const {
    OUTCOME_TRY(public_key, secp256k1_->derivePublicKeyCompressed(private_key));
    return common::Buffer{public_key.view()};
  }

  outcome::result<std::string> CosmosAdapter::addressFromPublicKey(
      common::BufferView public_key) const {
    if (public_key.size()
            != crypto::secp256k1::constants::kCompressedPublicKeySize
        or not secp256k1_->isValidPublicKey(public_key)) {
      return ChainAdapterError::INVALID_PUBLIC_KEY;
    }
    auto sha = hasher_->sha2_256(public_key);
    OUTCOME_TRY(account_id, hasher_->ripemd_160(sha.view()));
    return crypto::bech32::encode(prefix_, account_id.view());
  }

}  // namespace gorc::keystore
