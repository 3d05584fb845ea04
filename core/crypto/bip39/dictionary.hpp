/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <unordered_map>

#include "crypto/bip39/entropy_accumulator.hpp"
#include "outcome/outcome.hpp"

namespace gorc::crypto::bip39 {

  enum class DictionaryError {
    ENTRY_NOT_FOUND = 1,
  };

  /**
   * @class Dictionary keeps and provides correspondence between mnemonic words
   * and entropy value. Only english dictionary is supported for now
   */
  class Dictionary {
   public:
    /**
     * @brief initializes dictionary
     */
    void initialize();

    /**
     * @brief looks for word in dictionary
     * @param word word to look for
     * @return entropy value or error if not found
     */
    outcome::result<EntropyToken> findValue(std::string_view word) const;

    /**
     * @brief word encoding \param token
     */
    std::string_view findWord(const EntropyToken &token) const;

   private:
    std::unordered_map<std::string_view, EntropyToken> entropy_map_;
  };
}  // namespace gorc::crypto::bip39

OUTCOME_HPP_DECLARE_ERROR(gorc::crypto::bip39, DictionaryError);
