/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "crypto/scrypt/scrypt_provider.hpp"
#include "filesystem/common.hpp"
#include "keystore/chain.hpp"

namespace gorc::application {

  /// Operations of the key management command
  enum class KeysAction {
    Add,
    Import,
    Delete,
    Rename,
    List,
    Show,
  };

  /**
   * Command to run with its operands and switches
   */
  struct KeysCommand {
    keystore::Chain chain{};
    KeysAction action{};
    /// key name, and the new name for rename
    std::vector<std::string> names;
    /// add: generate a mnemonic instead of a bare random key
    bool with_mnemonic = false;
    size_t words = 24;
    /// import: BIP-0044 account index
    uint32_t account = 0;
    /// import: explicit derivation path, overrides account
    std::optional<std::string> hd_path;
    /// import: prompt for a BIP-0039 password
    bool ask_bip39_password = false;
  };

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    /**
     * @return path to the keystore directory
     */
    virtual const filesystem::path &keystorePath() const = 0;

    /**
     * @return bech32 human readable part of Cosmos addresses
     */
    virtual const std::string &cosmosPrefix() const = 0;

    /**
     * @return cost of the passphrase KDF for newly encrypted keys
     */
    virtual const crypto::ScryptParams &scryptParams() const = 0;

    /**
     * @return log levels tuning, `level` or `group=level` items
     */
    virtual const std::vector<std::string> &log() const = 0;

    virtual const KeysCommand &command() const = 0;
  };

}  // namespace gorc::application
