/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "keystore/impl/keystore_impl.hpp"

#include <boost/assert.hpp>

#include "keystore/key_name.hpp"
#include "keystore/keystore_error.hpp"

namespace gorc::keystore {

  KeystoreImpl::KeystoreImpl(std::shared_ptr<DerivationEngine> engine,
                             std::shared_ptr<ChainAdapterRegistry> adapters,
                             std::shared_ptr<SecretCodec> codec,
                             std::shared_ptr<RecordStore> store)
      : engine_{std::move(engine)},
        adapters_{std::move(adapters)},
        codec_{std::move(codec)},
        store_{std::move(store)},
        logger_{log::createLogger("Keystore", "key_store")} {
    BOOST_ASSERT(engine_ != nullptr);
    BOOST_ASSERT(adapters_ != nullptr);
    BOOST_ASSERT(codec_ != nullptr);
    BOOST_ASSERT(store_ != nullptr);
  }

  outcome::result<void> KeystoreImpl::checkNewName(std::string_view name,
                                                   Chain chain) const {
    if (not isValidKeyName(name)) {
      return KeystoreError::INVALID_NAME;
    }
    OUTCOME_TRY(taken, store_->exists(name, chain));
    if (taken) {
      return KeystoreError::NAME_ALREADY_EXISTS;
    }
    return outcome::success();
  }

  outcome::result<KeyInfo> KeystoreImpl::store(
      std::string_view name,
      Chain chain,
      const crypto::secp256k1::SecretKey &private_key,
      std::optional<std::string> derivation_path,
      std::string_view passphrase) {
    OUTCOME_TRY(adapter, adapters_->get(chain));

    auto public_key = adapter->publicKeyFromPrivate(private_key);
    if (not public_key) {
      SL_ERROR(logger_,
               "Public key of {} key {} can't be computed: {}",
               chain,
               name,
               public_key.error().message());
      return KeystoreError::KEY_DERIVATION_FAILED;
    }
    auto address = adapter->addressFromPublicKey(public_key.value());
    if (not address) {
      SL_ERROR(logger_,
               "Address of {} key {} can't be computed: {}",
               chain,
               name,
               address.error().message());
      return KeystoreError::KEY_DERIVATION_FAILED;
    }

    auto serialized = adapter->serializePrivateKey(private_key);
    OUTCOME_TRY(secret,
                codec_->encrypt(serialized, passphrase, toString(chain)));

    KeyRecord record{
        .name = std::string{name},
        .chain = chain,
        .public_key = public_key.value(),
        .address = address.value(),
        .encrypted_secret = std::move(secret),
        .derivation_path = std::move(derivation_path),
    };
    OUTCOME_TRY(store_->add(record));
    SL_INFO(logger_,
            "Added {} key {} with address {}",
            chain,
            name,
            record.address);

    return KeyInfo{
        .name = std::move(record.name),
        .chain = chain,
        .public_key = std::move(record.public_key),
        .address = std::move(record.address),
        .derivation_path = std::move(record.derivation_path),
    };
  }

  outcome::result<KeyInfo> KeystoreImpl::add(std::string_view name,
                                             Chain chain,
                                             std::string_view passphrase) {
    OUTCOME_TRY(checkNewName(name, chain));
    OUTCOME_TRY(private_key, engine_->generateRandom(chain));
    return store(name, chain, private_key, std::nullopt, passphrase);
  }

  outcome::result<MnemonicKeyInfo> KeystoreImpl::addWithMnemonic(
      std::string_view name,
      Chain chain,
      std::string_view passphrase,
      size_t words) {
    OUTCOME_TRY(checkNewName(name, chain));
    OUTCOME_TRY(mnemonic, engine_->generateMnemonic(words));
    OUTCOME_TRY(info,
                importMnemonic(name,
                               chain,
                               {mnemonic.data(), mnemonic.size()},
                               passphrase,
                               DerivationOptions{}));
    return MnemonicKeyInfo{
        .info = std::move(info),
        .mnemonic = std::move(mnemonic),
    };
  }

  outcome::result<KeyInfo> KeystoreImpl::importMnemonic(
      std::string_view name,
      Chain chain,
      std::string_view mnemonic,
      std::string_view passphrase,
      const DerivationOptions &options) {
    OUTCOME_TRY(checkNewName(name, chain));
    OUTCOME_TRY(derived, engine_->deriveFromMnemonic(mnemonic, chain, options));
    return store(name,
                 chain,
                 derived.private_key,
                 derived.path.toString(),
                 passphrase);
  }

  outcome::result<void> KeystoreImpl::remove(std::string_view name,
                                             Chain chain) {
    OUTCOME_TRY(store_->remove(name, chain));
    SL_INFO(logger_, "Deleted {} key {}", chain, name);
    return outcome::success();
  }

  outcome::result<void> KeystoreImpl::rename(std::string_view old_name,
                                             std::string_view new_name,
                                             Chain chain) {
    if (not isValidKeyName(new_name)) {
      return KeystoreError::INVALID_NAME;
    }
    OUTCOME_TRY(store_->rename(old_name, new_name, chain));
    SL_INFO(logger_, "Renamed {} key {} to {}", chain, old_name, new_name);
    return outcome::success();
  }

  outcome::result<ListResult> KeystoreImpl::list(Chain chain) const {
    return store_->list(chain);
  }

  outcome::result<KeyInfo> KeystoreImpl::show(
      std::string_view name, Chain chain, std::string_view passphrase) const {
    OUTCOME_TRY(adapter, adapters_->get(chain));
    OUTCOME_TRY(record, store_->get(name, chain));
    OUTCOME_TRY(serialized,
                codec_->decrypt(
                    record.encrypted_secret, passphrase, toString(chain)));

    auto private_key = adapter->deserializePrivateKey(serialized);
    if (not private_key) {
      SL_WARN(logger_, "{} key {} decrypts to an invalid scalar", chain, name);
      return KeystoreError::CORRUPT_RECORD;
    }
    // the scalar is valid here, so failures come from the crypto backend
    auto public_key = adapter->publicKeyFromPrivate(private_key.value());
    if (not public_key) {
      SL_ERROR(logger_,
               "Public key of {} key {} can't be computed: {}",
               chain,
               name,
               public_key.error().message());
      return KeystoreError::KEY_DERIVATION_FAILED;
    }
    auto address = adapter->addressFromPublicKey(public_key.value());
    if (not address) {
      SL_ERROR(logger_,
               "Address of {} key {} can't be computed: {}",
               chain,
               name,
               address.error().message());
      return KeystoreError::KEY_DERIVATION_FAILED;
    }
    if (public_key.value() != record.public_key
        or address.value() != record.address) {
      SL_WARN(logger_,
              "{} key {} doesn't match its stored public key or address",
              chain,
              name);
      return KeystoreError::CORRUPT_RECORD;
    }

    return KeyInfo{
        .name = std::move(record.name),
        .chain = chain,
        .public_key = std::move(record.public_key),
        .address = std::move(record.address),
        .derivation_path = std::move(record.derivation_path),
    };
  }

}  // namespace gorc::keystore
