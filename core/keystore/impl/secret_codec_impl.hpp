/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "keystore/secret_codec.hpp"

#include "crypto/aes/aes_gcm_provider.hpp"
#include "crypto/random_generator.hpp"
#include "crypto/scrypt/scrypt_provider.hpp"
#include "log/logger.hpp"

namespace gorc::keystore {

  class SecretCodecImpl : public SecretCodec {
   public:
    static constexpr uint32_t kFormatVersion = 1;
    static constexpr std::string_view kKdfName = "scrypt";
    static constexpr std::string_view kCipherName = "aes-256-gcm";
    static constexpr size_t kSaltSize = 32;

    SecretCodecImpl(std::shared_ptr<crypto::CSPRNG> random,
                    std::shared_ptr<crypto::ScryptProvider> scrypt,
                    std::shared_ptr<crypto::AesGcmProvider> aes_gcm,
                    crypto::ScryptParams params);

    outcome::result<EncryptedSecret> encrypt(
        const crypto::SecureBuffer &serialized_key,
        std::string_view passphrase,
        std::string_view associated_data) const override;

    outcome::result<crypto::SecureBuffer> decrypt(
        const EncryptedSecret &secret,
        std::string_view passphrase,
        std::string_view associated_data) const override;

   private:
    outcome::result<common::Buffer> randomBytes(size_t size) const;

    std::shared_ptr<crypto::CSPRNG> random_;
    std::shared_ptr<crypto::ScryptProvider> scrypt_;
    std::shared_ptr<crypto::AesGcmProvider> aes_gcm_;
    crypto::ScryptParams params_;
    log::Logger logger_;
  };

}  // namespace gorc::keystore
