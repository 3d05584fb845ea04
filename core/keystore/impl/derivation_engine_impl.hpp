/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "keystore/derivation_engine.hpp"

#include "crypto/bip32/bip32_provider.hpp"
#include "crypto/bip39/bip39_provider.hpp"
#include "crypto/random_generator.hpp"
#include "keystore/chain_adapter_registry.hpp"
#include "log/logger.hpp"

namespace gorc::keystore {

  class DerivationEngineImpl : public DerivationEngine {
   public:
    /// random scalars out of range are redrawn at most this many times
    static constexpr size_t kMaxAttempts = 16;

    DerivationEngineImpl(std::shared_ptr<crypto::CSPRNG> random,
                         std::shared_ptr<crypto::Bip39Provider> bip39_provider,
                         std::shared_ptr<crypto::Bip32Provider> bip32_provider,
                         std::shared_ptr<ChainAdapterRegistry> adapters);

    outcome::result<crypto::secp256k1::SecretKey> generateRandom(
        Chain chain) const override;

    outcome::result<DerivedKey> deriveFromMnemonic(
        std::string_view mnemonic,
        Chain chain,
        const DerivationOptions &options) const override;

    outcome::result<crypto::SecureString> generateMnemonic(
        size_t words) const override;

   private:
    outcome::result<crypto::bip32::DerivationPath> resolvePath(
        const ChainAdapter &adapter, const DerivationOptions &options) const;

    std::shared_ptr<crypto::CSPRNG> random_;
    std::shared_ptr<crypto::Bip39Provider> bip39_provider_;
    std::shared_ptr<crypto::Bip32Provider> bip32_provider_;
    std::shared_ptr<ChainAdapterRegistry> adapters_;
    log::Logger logger_;
  };

}  // namespace gorc::keystore
