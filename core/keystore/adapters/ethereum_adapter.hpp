/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "keystore/adapters/secp256k1_adapter.hpp"

namespace gorc::keystore {

  /**
   * Ethereum accounts: uncompressed public keys, addresses are the last 20
   * bytes of Keccak-256 of the point, EIP-55 checksummed
   */
  class EthereumAdapter : public Secp256k1Adapter {
   public:
    static constexpr uint32_t kCoinType = 60;

    EthereumAdapter(std::shared_ptr<crypto::Hasher> hasher,
                    std::shared_ptr<crypto::Secp256k1Provider> secp256k1);

    Chain chain() const override;

    uint32_t coinType() const override;

    outcome::result<common::Buffer> publicKeyFromPrivate(
        const crypto::secp256k1::SecretKey &private_key) const override;

    outcome::result<std::string> addressFromPublicKey(
        common::BufferView public_key) const override;

    /**
     * @brief applies EIP-55 mixed case checksum to 20 address bytes
     * @return 0x-prefixed address
     */
    outcome::result<std::string> checksumAddress(
        common::BufferView address) const;
  };

}  // namespace gorc::keystore
