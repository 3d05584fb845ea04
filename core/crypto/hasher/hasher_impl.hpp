/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hasher.hpp"

namespace gorc::crypto {

  class HasherImpl : public Hasher {
   public:
    ~HasherImpl() override = default;

    Hash256 sha2_256(common::BufferView data) const override;

    outcome::result<Hash160> ripemd_160(
        common::BufferView data) const override;

    outcome::result<Hash256> keccak_256(
        common::BufferView data) const override;

    outcome::result<Hash512> hmac_sha512(
        common::BufferView key, common::BufferView data) const override;
  };

}  // namespace gorc::crypto
