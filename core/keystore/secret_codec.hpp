/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "crypto/common.hpp"
#include "keystore/key_record.hpp"

namespace gorc::keystore {

  /**
   * @class SecretCodec passphrase based encryption of serialized private keys
   */
  class SecretCodec {
   public:
    virtual ~SecretCodec() = default;

    /**
     * @brief encrypts \param serialized_key under a key stretched from
     * \param passphrase with fresh salt and nonce
     * @param associated_data authenticated along with the ciphertext, binds
     * the result to its context
     */
    virtual outcome::result<EncryptedSecret> encrypt(
        const crypto::SecureBuffer &serialized_key,
        std::string_view passphrase,
        std::string_view associated_data) const = 0;

    /**
     * @brief reverses encrypt
     * @return DECRYPTION_FAILED for any authentication failure, so a wrong
     * passphrase is indistinguishable from tampering; CORRUPT_RECORD for
     * unsupported algorithms or parameters
     */
    virtual outcome::result<crypto::SecureBuffer> decrypt(
        const EncryptedSecret &secret,
        std::string_view passphrase,
        std::string_view associated_data) const = 0;
  };

}  // namespace gorc::keystore
