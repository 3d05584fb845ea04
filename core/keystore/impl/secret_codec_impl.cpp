/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "keystore/impl/secret_codec_impl.hpp"

#include <boost/assert.hpp>

#include "keystore/keystore_error.hpp"

namespace gorc::keystore {

  namespace aes_gcm = crypto::constants::aes_gcm;

  SecretCodecImpl::SecretCodecImpl(
      std::shared_ptr<crypto::CSPRNG> random,
      std::shared_ptr<crypto::ScryptProvider> scrypt,
      std::shared_ptr<crypto::AesGcmProvider> aes_gcm,
      crypto::ScryptParams params)
      : random_{std::move(random)},
        scrypt_{std::move(scrypt)},
        aes_gcm_{std::move(aes_gcm)},
        params_{params},
        logger_{log::createLogger("SecretCodec", "keystore")} {
    BOOST_ASSERT(random_ != nullptr);
    BOOST_ASSERT(scrypt_ != nullptr);
    BOOST_ASSERT(aes_gcm_ != nullptr);
  }

  outcome::result<common::Buffer> SecretCodecImpl::randomBytes(
      size_t size) const {
    common::Buffer out(size, 0);
    if (auto res = random_->fillRandomly(out); not res) {
      SL_ERROR(logger_, "Random source failed: {}", res.error().message());
      return KeystoreError::ENTROPY_SOURCE_ERROR;
    }
    return out;
  }

  outcome::result<EncryptedSecret> SecretCodecImpl::encrypt(
      const crypto::SecureBuffer &serialized_key,
      std::string_view passphrase,
      std::string_view associated_data) const {
    OUTCOME_TRY(salt, randomBytes(kSaltSize));
    OUTCOME_TRY(nonce, randomBytes(aes_gcm::NONCE_SIZE));

    OUTCOME_TRY(key,
                scrypt_->deriveKey(common::str2byte(passphrase),
                                   salt,
                                   params_,
                                   aes_gcm::KEY_SIZE));
    OUTCOME_TRY(ciphertext,
                aes_gcm_->encrypt(key,
                                  nonce,
                                  serialized_key.view(),
                                  common::str2byte(associated_data)));

    SL_TRACE(logger_,
             "Encrypted secret bound to {} with scrypt N={} r={} p={}",
             associated_data,
             params_.n,
             params_.r,
             params_.p);
    return EncryptedSecret{
        .version = kFormatVersion,
        .kdf = std::string{kKdfName},
        .kdf_params = params_,
        .dklen = aes_gcm::KEY_SIZE,
        .salt = std::move(salt),
        .cipher = std::string{kCipherName},
        .nonce = std::move(nonce),
        .ciphertext = std::move(ciphertext),
    };
  }

  outcome::result<crypto::SecureBuffer> SecretCodecImpl::decrypt(
      const EncryptedSecret &secret,
      std::string_view passphrase,
      std::string_view associated_data) const {
    if (secret.version != kFormatVersion or secret.kdf != kKdfName
        or secret.cipher != kCipherName or secret.dklen != aes_gcm::KEY_SIZE
        or secret.salt.empty() or secret.nonce.size() != aes_gcm::NONCE_SIZE) {
      SL_DEBUG(logger_,
               "Unsupported encryption scheme {}/{} version {}",
               secret.kdf,
               secret.cipher,
               secret.version);
      return KeystoreError::CORRUPT_RECORD;
    }
    if (auto res = scrypt_->validate(secret.kdf_params); not res) {
      SL_DEBUG(logger_, "Stored scrypt parameters are out of range");
      return KeystoreError::CORRUPT_RECORD;
    }

    OUTCOME_TRY(key,
                scrypt_->deriveKey(common::str2byte(passphrase),
                                   secret.salt,
                                   secret.kdf_params,
                                   secret.dklen));
    auto plaintext = aes_gcm_->decrypt(key,
                                       secret.nonce,
                                       secret.ciphertext,
                                       common::str2byte(associated_data));
    if (not plaintext) {
      SL_DEBUG(
          logger_, "Secret bound to {} failed to decrypt", associated_data);
      return KeystoreError::DECRYPTION_FAILED;
    }
    return std::move(plaintext.value());
  }

}  // namespace gorc::keystore
