/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "keystore/adapters/ethereum_adapter.hpp"

#include <cctype>

#include "common/hexutil.hpp"

namespace gorc::keystore {

  namespace {
    constexpr size_t kAddressSize = 20;
    constexpr uint8_t kUncompressedTag = 0x04;
  }  // namespace

  EthereumAdapter::EthereumAdapter(
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<crypto::Secp256k1Provider> secp256k1)
      : Secp256k1Adapter{std::move(hasher), std::move(secp256k1)} {}

  Chain EthereumAdapter::chain() const {
    return Chain::Ethereum;
  }

  uint32_t EthereumAdapter::coinType() const {
    return kCoinType;
  }

  outcome::result<common::Buffer> EthereumAdapter::publicKeyFromPrivate(
      const crypto::secp256k1::SecretKey &private_key) const {
    OUTCOME_TRY(public_key,
                secp256k1_->derivePublicKeyUncompressed(private_key));
    return common::Buffer{public_key.view()};
  }

  outcome::result<std::string> EthereumAdapter::addressFromPublicKey(
      common::BufferView public_key) const {
    if (public_key.size()
            != crypto::secp256k1::constants::kUncompressedPublicKeySize
        or public_key[0] != kUncompressedTag
        or not secp256k1_->isValidPublicKey(public_key)) {
      return ChainAdapterError::INVALID_PUBLIC_KEY;
    }
    // the 0x04 tag is not hashed
    OUTCOME_TRY(hash, hasher_->keccak_256(public_key.subspan(1)));
    return checksumAddress(hash.view().subspan(hash.size() - kAddressSize));
  }

  outcome::result<std::string> EthereumAdapter::checksumAddress(
      common::BufferView address) const {
    auto hex = common::hex_lower(address);
    OUTCOME_TRY(hash, hasher_->keccak_256(common::str2byte(hex)));
    for (size_t i = 0; i < hex.size(); ++i) {
      auto nibble = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0x0f);
      if (std::isalpha(static_cast<unsigned char>(hex[i])) and nibble >= 8) {
        hex[i] = static_cast<char>(
            std::toupper(static_cast<unsigned char>(hex[i])));
      }
    }
    return "0x" + hex;
  }

}  // namespace gorc::keystore
