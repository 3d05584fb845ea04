/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/bip39/bip39_provider.hpp"

#include "crypto/bip39/dictionary.hpp"
#include "crypto/pbkdf2/pbkdf2_provider.hpp"
#include "log/logger.hpp"

namespace gorc::crypto {

  enum class Bip39ProviderError {
    INVALID_CHECKSUM = 1,
  };

  class Bip39ProviderImpl : public Bip39Provider {
   public:
    explicit Bip39ProviderImpl(std::shared_ptr<Pbkdf2Provider> pbkdf2_provider);

    ~Bip39ProviderImpl() override = default;

    outcome::result<SecureBuffer> calculateEntropy(
        const bip39::Words &word_list) const override;

    outcome::result<bip39::Bip39Seed> makeSeed(
        const bip39::Mnemonic &mnemonic,
        std::string_view password) const override;

    outcome::result<bip39::Words> generateMnemonic(
        common::BufferView entropy) const override;

   private:
    std::shared_ptr<Pbkdf2Provider> pbkdf2_provider_;
    bip39::Dictionary dictionary_;
    log::Logger logger_;
  };

}  // namespace gorc::crypto

OUTCOME_HPP_DECLARE_ERROR(gorc::crypto, Bip39ProviderError);
