/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/scrypt/impl/scrypt_provider_impl.hpp"

#include <openssl/evp.h>

namespace gorc::crypto {

  outcome::result<void> ScryptProviderImpl::validate(
      const ScryptParams &params) const {
    // N must be a power of two greater than one
    if (params.n < 2 or (params.n & (params.n - 1)) != 0 or params.n > kMaxN) {
      return ScryptProviderError::INVALID_PARAMETERS;
    }
    if (params.r == 0 or params.r > kMaxR or params.p == 0
        or params.p > kMaxP) {
      return ScryptProviderError::INVALID_PARAMETERS;
    }
    return outcome::success();
  }

  outcome::result<SecureBuffer> ScryptProviderImpl::deriveKey(
      common::BufferView passphrase,
      common::BufferView salt,
      const ScryptParams &params,
      size_t key_length) const {
    OUTCOME_TRY(validate(params));

    // OpenSSL refuses to allocate more than maxmem, which defaults to 32MiB
    const uint64_t maxmem =
        128ull * params.r * (params.n + params.p + 2) + (1ull << 20);

    SecureBuffer out(key_length, 0);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto *pass = reinterpret_cast<const char *>(passphrase.data());
    const auto res = EVP_PBE_scrypt(pass,
                                    passphrase.size(),
                                    salt.data(),
                                    salt.size(),
                                    params.n,
                                    params.r,
                                    params.p,
                                    maxmem,
                                    out.data(),
                                    out.size());
    if (res != 1) {
      return ScryptProviderError::KEY_DERIVATION_FAILED;
    }
    return out;
  }

}  // namespace gorc::crypto

OUTCOME_CPP_DEFINE_CATEGORY(gorc::crypto, ScryptProviderError, e) {
  using E = gorc::crypto::ScryptProviderError;
  switch (e) {
    case E::INVALID_PARAMETERS:
      return "scrypt parameters are out of the supported range";
    case E::KEY_DERIVATION_FAILED:
      return "failed to derive key with scrypt";
  }
  return "unknown ScryptProviderError";
}
