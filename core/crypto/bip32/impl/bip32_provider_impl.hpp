/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/bip32/bip32_provider.hpp"

#include "crypto/hasher.hpp"
#include "crypto/secp256k1_provider.hpp"
#include "log/logger.hpp"

namespace gorc::crypto {

  enum class Bip32ProviderError {
    INVALID_SEED_LENGTH = 1,
    INVALID_MASTER_KEY,
    INVALID_CHILD_KEY,
  };

  class Bip32ProviderImpl : public Bip32Provider {
   public:
    Bip32ProviderImpl(std::shared_ptr<Hasher> hasher,
                      std::shared_ptr<Secp256k1Provider> secp256k1_provider);

    ~Bip32ProviderImpl() override = default;

    outcome::result<bip32::ExtendedPrivateKey> masterKey(
        common::BufferView seed) const override;

    outcome::result<bip32::ExtendedPrivateKey> deriveChild(
        const bip32::ExtendedPrivateKey &parent,
        uint32_t index) const override;

    outcome::result<secp256k1::SecretKey> derivePath(
        common::BufferView seed,
        const bip32::DerivationPath &path) const override;

   private:
    std::shared_ptr<Hasher> hasher_;
    std::shared_ptr<Secp256k1Provider> secp256k1_provider_;
    log::Logger logger_;
  };

}  // namespace gorc::crypto

OUTCOME_HPP_DECLARE_ERROR(gorc::crypto, Bip32ProviderError);
