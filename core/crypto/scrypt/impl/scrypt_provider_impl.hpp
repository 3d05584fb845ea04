/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/scrypt/scrypt_provider.hpp"

namespace gorc::crypto {

  class ScryptProviderImpl : public ScryptProvider {
   public:
    /// Upper bound of N accepted when reading records
    static constexpr uint64_t kMaxN = 1u << 20;
    static constexpr uint32_t kMaxR = 32;
    static constexpr uint32_t kMaxP = 16;

    ~ScryptProviderImpl() override = default;

    outcome::result<void> validate(const ScryptParams &params) const override;

    outcome::result<SecureBuffer> deriveKey(common::BufferView passphrase,
                                            common::BufferView salt,
                                            const ScryptParams &params,
                                            size_t key_length) const override;
  };

}  // namespace gorc::crypto
