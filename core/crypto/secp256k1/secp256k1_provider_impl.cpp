/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/secp256k1/secp256k1_provider_impl.hpp"

namespace gorc::crypto {

  Secp256k1ProviderImpl::Secp256k1ProviderImpl()
      : context_(secp256k1_context_create(SECP256K1_CONTEXT_SIGN
                                          | SECP256K1_CONTEXT_VERIFY),
                 secp256k1_context_destroy) {}

  bool Secp256k1ProviderImpl::isValidSecretKey(
      std::span<const uint8_t, secp256k1::constants::kSecretKeySize> secret)
      const {
    return 1 == secp256k1_ec_seckey_verify(context_.get(), secret.data());
  }

  bool Secp256k1ProviderImpl::isValidPublicKey(
      common::BufferView public_key) const {
    secp256k1_pubkey pubkey;
    return 1
        == secp256k1_ec_pubkey_parse(
               context_.get(), &pubkey, public_key.data(), public_key.size());
  }

  outcome::result<secp256k1::CompressedPublicKey>
  Secp256k1ProviderImpl::derivePublicKeyCompressed(
      const secp256k1::SecretKey &secret_key) const {
    OUTCOME_TRY(pubkey, derivePublicKey(secret_key));
    secp256k1::CompressedPublicKey pubkey_out;
    OUTCOME_TRY(serialize(pubkey, pubkey_out, SECP256K1_EC_COMPRESSED));
    return pubkey_out;
  }

  outcome::result<secp256k1::UncompressedPublicKey>
  Secp256k1ProviderImpl::derivePublicKeyUncompressed(
      const secp256k1::SecretKey &secret_key) const {
    OUTCOME_TRY(pubkey, derivePublicKey(secret_key));
    secp256k1::UncompressedPublicKey pubkey_out;
    OUTCOME_TRY(serialize(pubkey, pubkey_out, SECP256K1_EC_UNCOMPRESSED));
    return pubkey_out;
  }

  outcome::result<secp256k1::SecretKey> Secp256k1ProviderImpl::tweakAdd(
      const secp256k1::SecretKey &secret_key,
      const secp256k1::Tweak &tweak) const {
    std::array<uint8_t, secp256k1::constants::kSecretKeySize> tweaked{};
    SecureCleanGuard guard{tweaked};
    std::ranges::copy(secret_key.unsafeBytes(), tweaked.begin());
    if (1
        != secp256k1_ec_seckey_tweak_add(
            context_.get(), tweaked.data(), tweak.data())) {
      return Secp256k1ProviderError::INVALID_TWEAK;
    }
    return secp256k1::SecretKey::from(std::move(guard));
  }

  outcome::result<secp256k1_pubkey> Secp256k1ProviderImpl::derivePublicKey(
      const secp256k1::SecretKey &secret_key) const {
    secp256k1_pubkey pubkey;
    if (1
        != secp256k1_ec_pubkey_create(
            context_.get(), &pubkey, secret_key.unsafeBytes().data())) {
      return Secp256k1ProviderError::INVALID_SECRET_KEY;
    }
    return pubkey;
  }

  outcome::result<void> Secp256k1ProviderImpl::serialize(
      const secp256k1_pubkey &pubkey,
      std::span<uint8_t> out,
      unsigned int flags) const {
    size_t outputlen = out.size();
    if (1
        != secp256k1_ec_pubkey_serialize(
            context_.get(), out.data(), &outputlen, &pubkey, flags)) {
      return Secp256k1ProviderError::SERIALIZATION_FAILED;
    }
    if (outputlen != out.size()) {
      return Secp256k1ProviderError::SERIALIZATION_FAILED;
    }
    return outcome::success();
  }
}  // namespace gorc::crypto

OUTCOME_CPP_DEFINE_CATEGORY(gorc::crypto, Secp256k1ProviderError, e) {
  using E = gorc::crypto::Secp256k1ProviderError;
  switch (e) {
    case E::INVALID_SECRET_KEY:
      return "secret key is zero or not below the curve order";
    case E::INVALID_TWEAK:
      return "tweak is out of range or produced a zero key";
    case E::SERIALIZATION_FAILED:
      return "public key serialization failed";
  }
  return "unknown Secp256k1ProviderError error occured";
}
