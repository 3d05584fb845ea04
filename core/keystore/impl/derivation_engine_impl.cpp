/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "keystore/impl/derivation_engine_impl.hpp"

#include <boost/assert.hpp>

#include "keystore/keystore_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(gorc::keystore, DerivationEngineError, e) {
  using E = gorc::keystore::DerivationEngineError;
  switch (e) {
    case E::UNSUPPORTED_WORD_COUNT:
      return "mnemonic must have 12, 15, 18, 21 or 24 words";
  }
  return "unknown DerivationEngineError";
}

namespace gorc::keystore {

  namespace secp256k1 = crypto::secp256k1;

  using SecretKeyGuard =
      crypto::SecureCleanGuard<uint8_t, secp256k1::constants::kSecretKeySize>;

  DerivationEngineImpl::DerivationEngineImpl(
      std::shared_ptr<crypto::CSPRNG> random,
      std::shared_ptr<crypto::Bip39Provider> bip39_provider,
      std::shared_ptr<crypto::Bip32Provider> bip32_provider,
      std::shared_ptr<ChainAdapterRegistry> adapters)
      : random_{std::move(random)},
        bip39_provider_{std::move(bip39_provider)},
        bip32_provider_{std::move(bip32_provider)},
        adapters_{std::move(adapters)},
        logger_{log::createLogger("DerivationEngine", "keystore")} {
    BOOST_ASSERT(random_ != nullptr);
    BOOST_ASSERT(bip39_provider_ != nullptr);
    BOOST_ASSERT(bip32_provider_ != nullptr);
    BOOST_ASSERT(adapters_ != nullptr);
  }

  outcome::result<secp256k1::SecretKey> DerivationEngineImpl::generateRandom(
      Chain chain) const {
    OUTCOME_TRY(adapter, adapters_->get(chain));
    for (size_t attempt = 0; attempt < kMaxAttempts; ++attempt) {
      std::array<uint8_t, secp256k1::constants::kSecretKeySize> bytes{};
      if (auto res = random_->fillRandomly(bytes); not res) {
        OPENSSL_cleanse(bytes.data(), bytes.size());
        SL_ERROR(logger_,
                 "Random source failed while generating {} key: {}",
                 chain,
                 res.error().message());
        return KeystoreError::ENTROPY_SOURCE_ERROR;
      }
      if (adapter->isValidPrivateKey(bytes)) {
        return secp256k1::SecretKey::from(SecretKeyGuard{bytes});
      }
      OPENSSL_cleanse(bytes.data(), bytes.size());
    }
    SL_ERROR(logger_,
             "Random source produced {} invalid {} keys in a row",
             kMaxAttempts,
             chain);
    return KeystoreError::ENTROPY_SOURCE_ERROR;
  }

  outcome::result<crypto::bip32::DerivationPath>
  DerivationEngineImpl::resolvePath(const ChainAdapter &adapter,
                                    const DerivationOptions &options) const {
    if (options.hd_path) {
      auto path = crypto::bip32::DerivationPath::parse(*options.hd_path);
      if (not path) {
        SL_DEBUG(logger_,
                 "Rejected derivation path {}: {}",
                 *options.hd_path,
                 path.error().message());
        return KeystoreError::INVALID_DERIVATION_PATH;
      }
      return std::move(path.value());
    }
    if ((options.account_index & crypto::bip32::kHardenedFlag) != 0) {
      return KeystoreError::INVALID_DERIVATION_PATH;
    }
    return adapter.derivationPath(options.account_index);
  }

  outcome::result<DerivedKey> DerivationEngineImpl::deriveFromMnemonic(
      std::string_view mnemonic,
      Chain chain,
      const DerivationOptions &options) const {
    OUTCOME_TRY(adapter, adapters_->get(chain));
    OUTCOME_TRY(path, resolvePath(*adapter, options));

    auto parsed = crypto::bip39::Mnemonic::parse(mnemonic);
    if (not parsed) {
      return KeystoreError::INVALID_MNEMONIC;
    }
    if (auto entropy = bip39_provider_->calculateEntropy(parsed.value().words);
        not entropy) {
      SL_DEBUG(logger_, "Invalid mnemonic: {}", entropy.error().message());
      return KeystoreError::INVALID_MNEMONIC;
    }

    auto seed = bip39_provider_->makeSeed(
        parsed.value(),
        {options.bip39_password.data(), options.bip39_password.size()});
    if (not seed) {
      SL_ERROR(logger_, "Seed expansion failed: {}", seed.error().message());
      return KeystoreError::KEY_DERIVATION_FAILED;
    }

    auto key = bip32_provider_->derivePath(
        common::BufferView{seed.value().unsafeBytes()}, path);
    if (not key) {
      SL_ERROR(logger_,
               "Derivation of {} key at {} failed: {}",
               chain,
               path.toString(),
               key.error().message());
      return KeystoreError::KEY_DERIVATION_FAILED;
    }
    SL_DEBUG(logger_, "Derived {} key at {}", chain, path.toString());
    return DerivedKey{
        .private_key = std::move(key.value()),
        .path = std::move(path),
    };
  }

  outcome::result<crypto::SecureString> DerivationEngineImpl::generateMnemonic(
      size_t words) const {
    switch (words) {
      case 12:
      case 15:
      case 18:
      case 21:
      case 24:
        break;
      default:
        return DerivationEngineError::UNSUPPORTED_WORD_COUNT;
    }
    // every 3 words carry 32 bits of entropy and 1 bit of checksum
    crypto::SecureBuffer entropy(words / 3 * 4, 0);
    if (auto res = random_->fillRandomly(entropy); not res) {
      SL_ERROR(logger_,
               "Random source failed while generating mnemonic: {}",
               res.error().message());
      return KeystoreError::ENTROPY_SOURCE_ERROR;
    }
    crypto::bip39::Mnemonic mnemonic;
    OUTCOME_TRY(generated, bip39_provider_->generateMnemonic(entropy.view()));
    mnemonic.words = std::move(generated);
    return mnemonic.sentence();
  }

}  // namespace gorc::keystore
