/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer_view.hpp"
#include "crypto/bip39/bip39_types.hpp"
#include "crypto/bip39/mnemonic.hpp"
#include "outcome/outcome.hpp"

namespace gorc::crypto {

  /**
   * @class Bip39Provider allows creating seed from mnemonic wordlist
   */
  class Bip39Provider {
   public:
    virtual ~Bip39Provider() = default;

    /**
     * @brief calculates entropy from mnemonic, validating words count, words
     * and checksum
     * @param word_list mnemonic word list
     * @return entropy value
     */
    virtual outcome::result<SecureBuffer> calculateEntropy(
        const bip39::Words &word_list) const = 0;

    /**
     * @brief makes seed from a mnemonic, which must be valid
     * @param mnemonic parsed mnemonic
     * @param password optional BIP-0039 password, empty if none
     * @return seed bytes
     */
    virtual outcome::result<bip39::Bip39Seed> makeSeed(
        const bip39::Mnemonic &mnemonic, std::string_view password) const = 0;

    /**
     * @brief encodes \param entropy with its checksum as mnemonic words
     * @param entropy 16, 20, 24, 28 or 32 bytes
     */
    virtual outcome::result<bip39::Words> generateMnemonic(
        common::BufferView entropy) const = 0;
  };

}  // namespace gorc::crypto
