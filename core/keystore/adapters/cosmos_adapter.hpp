/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "keystore/adapters/secp256k1_adapter.hpp"

namespace gorc::keystore {

  /**
   * Cosmos SDK accounts: compressed public keys, addresses are
   * bech32(prefix, RIPEMD160(SHA256(pubkey)))
   */
  class CosmosAdapter : public Secp256k1Adapter {
   public:
    static constexpr uint32_t kCoinType = 118;
    static constexpr std::string_view kDefaultPrefix = "cosmos";

    CosmosAdapter(std::shared_ptr<crypto::Hasher> hasher,
                  std::shared_ptr<crypto::Secp256k1Provider> secp256k1,
                  std::string prefix = std::string{kDefaultPrefix});

    Chain chain() const override;

    uint32_t coinType() const override;

    outcome::result<common::Buffer> publicKeyFromPrivate(
        const crypto::secp256k1::SecretKey &private_key) const override;

    outcome::result<std::string> addressFromPublicKey(
        common::BufferView public_key) const override;

    const std::string &prefix() const {
      return prefix_;
    }

   private:
    std::string prefix_;
  };

}  // namespace gorc::keystore
