/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/aes/aes_gcm_provider.hpp"

namespace gorc::crypto {

  class AesGcmProviderImpl : public AesGcmProvider {
   public:
    ~AesGcmProviderImpl() override = default;

    outcome::result<common::Buffer> encrypt(
        common::BufferView key,
        common::BufferView nonce,
        common::BufferView plaintext,
        common::BufferView aad) const override;

    outcome::result<SecureBuffer> decrypt(
        common::BufferView key,
        common::BufferView nonce,
        common::BufferView ciphertext,
        common::BufferView aad) const override;
  };

}  // namespace gorc::crypto
