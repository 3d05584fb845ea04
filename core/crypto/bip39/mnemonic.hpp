/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "crypto/bip39/bip39_types.hpp"
#include "outcome/outcome.hpp"

namespace gorc::crypto::bip39 {
  enum class MnemonicError {
    INVALID_MNEMONIC = 1,
  };

  struct Mnemonic {
    Words words;

    Mnemonic() = default;
    Mnemonic(const Mnemonic &) = default;
    Mnemonic &operator=(const Mnemonic &) = default;

    /// wipes the words
    ~Mnemonic();

    /**
     * @brief parse mnemonic from phrase
     * @param phrase valid utf8 list of words separated by whitespace; case and
     * surrounding or repeated whitespace are not significant
     * @return Mnemonic instance
     */
    static outcome::result<Mnemonic> parse(std::string_view phrase);

    /**
     * @brief words joined with single spaces, the form BIP-0039 feeds to
     * PBKDF2
     */
    SecureString sentence() const;
  };
}  // namespace gorc::crypto::bip39

OUTCOME_HPP_DECLARE_ERROR(gorc::crypto::bip39, MnemonicError);
