/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer_view.hpp"
#include "crypto/common.hpp"
#include "outcome/outcome.hpp"

namespace gorc::crypto {

  enum class ScryptProviderError {
    INVALID_PARAMETERS = 1,
    KEY_DERIVATION_FAILED,
  };

  /// scrypt cost parameters
  struct ScryptParams {
    uint64_t n = 1u << 15;
    uint32_t r = 8;
    uint32_t p = 1;

    bool operator==(const ScryptParams &) const = default;
  };

  /**
   * @class ScryptProvider derives symmetric keys from passphrases with the
   * memory-hard scrypt function
   */
  class ScryptProvider {
   public:
    virtual ~ScryptProvider() = default;

    /**
     * @brief checks that \param params are ones scrypt accepts and that the
     * memory they need is reasonable for a local keystore
     */
    virtual outcome::result<void> validate(const ScryptParams &params) const = 0;

    /**
     * @brief derives key from passphrase and salt
     * @param passphrase secret to stretch
     * @param salt random salt
     * @param params cost parameters
     * @param key_length length of generated key
     * @return derived key
     */
    virtual outcome::result<SecureBuffer> deriveKey(
        common::BufferView passphrase,
        common::BufferView salt,
        const ScryptParams &params,
        size_t key_length) const = 0;
  };

}  // namespace gorc::crypto

OUTCOME_HPP_DECLARE_ERROR(gorc::crypto, ScryptProviderError);
