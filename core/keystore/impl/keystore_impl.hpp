/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "keystore/keystore.hpp"

#include "keystore/chain_adapter_registry.hpp"
#include "keystore/record_store.hpp"
#include "keystore/secret_codec.hpp"
#include "log/logger.hpp"

namespace gorc::keystore {

  class KeystoreImpl : public Keystore {
   public:
    KeystoreImpl(std::shared_ptr<DerivationEngine> engine,
                 std::shared_ptr<ChainAdapterRegistry> adapters,
                 std::shared_ptr<SecretCodec> codec,
                 std::shared_ptr<RecordStore> store);

    outcome::result<KeyInfo> add(std::string_view name,
                                 Chain chain,
                                 std::string_view passphrase) override;

    outcome::result<MnemonicKeyInfo> addWithMnemonic(
        std::string_view name,
        Chain chain,
        std::string_view passphrase,
        size_t words) override;

    outcome::result<KeyInfo> importMnemonic(
        std::string_view name,
        Chain chain,
        std::string_view mnemonic,
        std::string_view passphrase,
        const DerivationOptions &options) override;

    outcome::result<void> remove(std::string_view name, Chain chain) override;

    outcome::result<void> rename(std::string_view old_name,
                                 std::string_view new_name,
                                 Chain chain) override;

    outcome::result<ListResult> list(Chain chain) const override;

    outcome::result<KeyInfo> show(std::string_view name,
                                  Chain chain,
                                  std::string_view passphrase) const override;

   private:
    /// INVALID_NAME or NAME_ALREADY_EXISTS unless \param name can be created
    outcome::result<void> checkNewName(std::string_view name,
                                       Chain chain) const;

    /// encrypts \param private_key and persists it as a new record
    outcome::result<KeyInfo> store(
        std::string_view name,
        Chain chain,
        const crypto::secp256k1::SecretKey &private_key,
        std::optional<std::string> derivation_path,
        std::string_view passphrase);

    std::shared_ptr<DerivationEngine> engine_;
    std::shared_ptr<ChainAdapterRegistry> adapters_;
    std::shared_ptr<SecretCodec> codec_;
    std::shared_ptr<RecordStore> store_;
    log::Logger logger_;
  };

}  // namespace gorc::keystore
