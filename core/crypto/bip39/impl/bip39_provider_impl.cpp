/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bip39/impl/bip39_provider_impl.hpp"

#include <boost/assert.hpp>

#include "crypto/bip39/entropy_accumulator.hpp"

namespace gorc::crypto {

  Bip39ProviderImpl::Bip39ProviderImpl(
      std::shared_ptr<Pbkdf2Provider> pbkdf2_provider)
      : pbkdf2_provider_{std::move(pbkdf2_provider)},
        logger_{log::createLogger("Bip39Provider", "bip39")} {
    BOOST_ASSERT(pbkdf2_provider_ != nullptr);
    dictionary_.initialize();
  }

  outcome::result<SecureBuffer> Bip39ProviderImpl::calculateEntropy(
      const bip39::Words &word_list) const {
    OUTCOME_TRY(accumulator,
                bip39::EntropyAccumulator::create(word_list.size()));
    for (const auto &w : word_list) {
      auto value = dictionary_.findValue(w);
      if (not value) {
        SL_DEBUG(logger_, "Mnemonic word is not in the english wordlist");
        return value.error();
      }
      OUTCOME_TRY(accumulator.append(value.value()));
    }

    OUTCOME_TRY(mnemonic_checksum, accumulator.getChecksum());
    OUTCOME_TRY(calculated_checksum, accumulator.calculateChecksum());

    if (mnemonic_checksum != calculated_checksum) {
      SL_DEBUG(logger_, "Mnemonic checksum mismatch");
      return Bip39ProviderError::INVALID_CHECKSUM;
    }

    return accumulator.getEntropy();
  }

  outcome::result<bip39::Bip39Seed> Bip39ProviderImpl::makeSeed(
      const bip39::Mnemonic &mnemonic, std::string_view password) const {
    // the seed is derived from the sentence, entropy is only checked
    if (auto entropy = calculateEntropy(mnemonic.words); not entropy) {
      return entropy.error();
    }

    auto sentence = mnemonic.sentence();
    SecureString salt{bip39::constants::BIP39_SALT_PREFIX.begin(),
                      bip39::constants::BIP39_SALT_PREFIX.end()};
    salt.append(password.begin(), password.end());

    OUTCOME_TRY(seed,
                pbkdf2_provider_->deriveKey(
                    common::str2byte({sentence.data(), sentence.size()}),
                    common::str2byte({salt.data(), salt.size()}),
                    bip39::constants::BIP39_ITERATIONS,
                    bip39::constants::BIP39_SEED_LEN_512));
    return bip39::Bip39Seed::from(seed);
  }

  outcome::result<bip39::Words> Bip39ProviderImpl::generateMnemonic(
      common::BufferView entropy) const {
    OUTCOME_TRY(accumulator, bip39::EntropyAccumulator::fromEntropy(entropy));
    OUTCOME_TRY(tokens, accumulator.getTokens());
    bip39::Words words;
    words.reserve(tokens.size());
    for (const auto &token : tokens) {
      words.emplace_back(dictionary_.findWord(token));
    }
    return words;
  }

}  // namespace gorc::crypto

OUTCOME_CPP_DEFINE_CATEGORY(gorc::crypto, Bip39ProviderError, e) {
  using E = gorc::crypto::Bip39ProviderError;
  switch (e) {
    case E::INVALID_CHECKSUM:
      return "mnemonic checksum does not match";
  }
  return "unknown Bip39ProviderError";
}
