/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <secp256k1.h>

#include "crypto/secp256k1_provider.hpp"

namespace gorc::crypto {

  enum class Secp256k1ProviderError {
    INVALID_SECRET_KEY = 1,
    INVALID_TWEAK,
    SERIALIZATION_FAILED,
  };

  class Secp256k1ProviderImpl : public Secp256k1Provider {
   public:
    ~Secp256k1ProviderImpl() override = default;

    Secp256k1ProviderImpl();

    bool isValidSecretKey(
        std::span<const uint8_t, secp256k1::constants::kSecretKeySize> secret)
        const override;

    bool isValidPublicKey(common::BufferView public_key) const override;

    outcome::result<secp256k1::CompressedPublicKey> derivePublicKeyCompressed(
        const secp256k1::SecretKey &secret_key) const override;

    outcome::result<secp256k1::UncompressedPublicKey>
    derivePublicKeyUncompressed(
        const secp256k1::SecretKey &secret_key) const override;

    outcome::result<secp256k1::SecretKey> tweakAdd(
        const secp256k1::SecretKey &secret_key,
        const secp256k1::Tweak &tweak) const override;

   private:
    outcome::result<secp256k1_pubkey> derivePublicKey(
        const secp256k1::SecretKey &secret_key) const;

    outcome::result<void> serialize(const secp256k1_pubkey &pubkey,
                                    std::span<uint8_t> out,
                                    unsigned int flags) const;

    std::unique_ptr<secp256k1_context, void (*)(secp256k1_context *)> context_;
  };
}  // namespace gorc::crypto

OUTCOME_HPP_DECLARE_ERROR(gorc::crypto, Secp256k1ProviderError);
