/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/pbkdf2/impl/pbkdf2_provider_impl.hpp"

#include <openssl/evp.h>

namespace gorc::crypto {

  outcome::result<SecureBuffer> Pbkdf2ProviderImpl::deriveKey(
      common::BufferView data,
      common::BufferView salt,
      size_t iterations,
      size_t key_length) const {
    SecureBuffer out(key_length, 0);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto *password = reinterpret_cast<const char *>(data.data());
    const auto res = PKCS5_PBKDF2_HMAC(password,
                                       static_cast<int>(data.size()),
                                       salt.data(),
                                       static_cast<int>(salt.size()),
                                       static_cast<int>(iterations),
                                       EVP_sha512(),
                                       static_cast<int>(key_length),
                                       out.data());
    if (res != 1) {
      return Pbkdf2ProviderError::KEY_DERIVATION_FAILED;
    }

    return out;
  }

}  // namespace gorc::crypto

OUTCOME_CPP_DEFINE_CATEGORY(gorc::crypto, Pbkdf2ProviderError, e) {
  using E = gorc::crypto::Pbkdf2ProviderError;
  switch (e) {
    case E::KEY_DERIVATION_FAILED:
      return "failed to derive key";
  }
  return "unknown Pbkdf2ProviderError";
}
