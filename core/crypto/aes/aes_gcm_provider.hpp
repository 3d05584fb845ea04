/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"
#include "crypto/common.hpp"
#include "outcome/outcome.hpp"

namespace gorc::crypto {

  enum class AesGcmError {
    INVALID_KEY_LENGTH = 1,
    INVALID_NONCE_LENGTH,
    CIPHERTEXT_TOO_SHORT,
    ENCRYPTION_FAILED,
    AUTHENTICATION_FAILED,
  };

  namespace constants::aes_gcm {
    constexpr size_t KEY_SIZE = 32;
    constexpr size_t NONCE_SIZE = 12;
    constexpr size_t TAG_SIZE = 16;
  }  // namespace constants::aes_gcm

  /**
   * @class AesGcmProvider authenticated encryption with AES-256 in Galois
   * counter mode
   */
  class AesGcmProvider {
   public:
    virtual ~AesGcmProvider() = default;

    /**
     * @brief encrypts and authenticates \param plaintext
     * @param key 32-byte key
     * @param nonce 12-byte nonce, must never repeat for one key
     * @param aad data authenticated but not encrypted
     * @return ciphertext with 16-byte tag appended
     */
    virtual outcome::result<common::Buffer> encrypt(
        common::BufferView key,
        common::BufferView nonce,
        common::BufferView plaintext,
        common::BufferView aad) const = 0;

    /**
     * @brief verifies and decrypts \param ciphertext
     * @param ciphertext ciphertext with 16-byte tag appended
     * @return plaintext, or AUTHENTICATION_FAILED for any mismatch of key,
     * nonce, aad, ciphertext or tag
     */
    virtual outcome::result<SecureBuffer> decrypt(
        common::BufferView key,
        common::BufferView nonce,
        common::BufferView ciphertext,
        common::BufferView aad) const = 0;
  };

}  // namespace gorc::crypto

OUTCOME_HPP_DECLARE_ERROR(gorc::crypto, AesGcmError);
