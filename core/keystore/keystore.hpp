/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "keystore/derivation_engine.hpp"
#include "keystore/key_record.hpp"

namespace gorc::keystore {

  /// Result of adding a key from a freshly generated mnemonic
  struct MnemonicKeyInfo {
    KeyInfo info;
    /// shown once to the operator, never stored
    crypto::SecureString mnemonic;
  };

  /**
   * @class Keystore named, passphrase protected Cosmos and Ethereum keys.
   * Private keys never leave it, only public information is returned.
   */
  class Keystore {
   public:
    virtual ~Keystore() = default;

    /**
     * @brief generates a random key and stores it under \param name
     */
    virtual outcome::result<KeyInfo> add(std::string_view name,
                                         Chain chain,
                                         std::string_view passphrase) = 0;

    /**
     * @brief generates a mnemonic of \param words words and imports it
     * @return stored key and the mnemonic to write down
     */
    virtual outcome::result<MnemonicKeyInfo> addWithMnemonic(
        std::string_view name,
        Chain chain,
        std::string_view passphrase,
        size_t words) = 0;

    /**
     * @brief derives a key from \param mnemonic and stores it under
     * \param name
     */
    virtual outcome::result<KeyInfo> importMnemonic(
        std::string_view name,
        Chain chain,
        std::string_view mnemonic,
        std::string_view passphrase,
        const DerivationOptions &options) = 0;

    /// irreversibly deletes the key
    virtual outcome::result<void> remove(std::string_view name,
                                         Chain chain) = 0;

    virtual outcome::result<void> rename(std::string_view old_name,
                                         std::string_view new_name,
                                         Chain chain) = 0;

    virtual outcome::result<ListResult> list(Chain chain) const = 0;

    /**
     * @brief decrypts the key to verify \param passphrase and the integrity of
     * the stored public key and address
     */
    virtual outcome::result<KeyInfo> show(
        std::string_view name,
        Chain chain,
        std::string_view passphrase) const = 0;
  };

}  // namespace gorc::keystore
