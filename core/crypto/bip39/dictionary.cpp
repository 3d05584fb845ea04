/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bip39/dictionary.hpp"

#include "crypto/bip39/wordlist/english.hpp"

namespace gorc::crypto::bip39 {

  void Dictionary::initialize() {
    entropy_map_.reserve(english::dictionary.size());
    for (size_t i = 0; i < english::dictionary.size(); ++i) {
      entropy_map_[english::dictionary[i]] = EntropyToken(i);
    }
  }

  outcome::result<EntropyToken> Dictionary::findValue(
      std::string_view word) const {
    auto loc = entropy_map_.find(word);
    if (entropy_map_.end() != loc) {
      return loc->second;
    }

    return DictionaryError::ENTRY_NOT_FOUND;
  }

  std::string_view Dictionary::findWord(const EntropyToken &token) const {
    // an 11-bit token always addresses the 2048-word list
    return english::dictionary[token.to_ulong()];
  }

}  // namespace gorc::crypto::bip39

OUTCOME_CPP_DEFINE_CATEGORY(gorc::crypto::bip39, DictionaryError, error) {
  using E = gorc::crypto::bip39::DictionaryError;
  switch (error) {
    case E::ENTRY_NOT_FOUND:
      return "word not found";
  }
  return "unknown DictionaryError error";
}
