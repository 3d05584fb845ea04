/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "crypto/bip32/derivation_path.hpp"
#include "crypto/secp256k1_types.hpp"
#include "keystore/chain.hpp"

namespace gorc::keystore {

  enum class DerivationEngineError {
    UNSUPPORTED_WORD_COUNT = 1,
  };

  /// Mnemonic import parameters besides the phrase itself
  struct DerivationOptions {
    uint32_t account_index = 0;
    crypto::SecureString bip39_password;
    /// overrides the chain's BIP-0044 path when set
    std::optional<std::string> hd_path;
  };

  struct DerivedKey {
    crypto::secp256k1::SecretKey private_key;
    crypto::bip32::DerivationPath path;
  };

  /**
   * @class DerivationEngine produces private keys, either fresh random ones
   * or ones deterministically derived from a BIP-0039 mnemonic
   */
  class DerivationEngine {
   public:
    virtual ~DerivationEngine() = default;

    /**
     * @brief draws a uniformly random scalar valid for \param chain
     * @return ENTROPY_SOURCE_ERROR if the system random source fails
     */
    virtual outcome::result<crypto::secp256k1::SecretKey> generateRandom(
        Chain chain) const = 0;

    /**
     * @brief BIP-0039 seed from \param mnemonic followed by BIP-0032
     * derivation along the chain's BIP-0044 path or options.hd_path
     * @return INVALID_MNEMONIC, INVALID_DERIVATION_PATH or
     * KEY_DERIVATION_FAILED on failure
     */
    virtual outcome::result<DerivedKey> deriveFromMnemonic(
        std::string_view mnemonic,
        Chain chain,
        const DerivationOptions &options) const = 0;

    /**
     * @brief fresh mnemonic of \param words words (12, 15, 18, 21 or 24)
     */
    virtual outcome::result<crypto::SecureString> generateMnemonic(
        size_t words) const = 0;
  };

}  // namespace gorc::keystore

OUTCOME_HPP_DECLARE_ERROR(gorc::keystore, DerivationEngineError);
