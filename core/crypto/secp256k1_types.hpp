/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "crypto/common.hpp"

namespace gorc::crypto::secp256k1 {
  namespace constants {
    static constexpr size_t kSecretKeySize = 32u;
    static constexpr size_t kUncompressedPublicKeySize = 65u;
    static constexpr size_t kCompressedPublicKeySize = 33u;
  }  // namespace constants

  struct SecretKeyTag;

  /**
   * 32-byte big-endian scalar, kept on the OpenSSL heap
   */
  using SecretKey = PrivateKey<constants::kSecretKeySize, SecretKeyTag>;

  /**
   * compressed SEC1 form of public key
   */
  using CompressedPublicKey = common::Blob<constants::kCompressedPublicKeySize>;

  /**
   * uncompressed SEC1 form of public key, 0x04 || X || Y
   */
  using UncompressedPublicKey =
      common::Blob<constants::kUncompressedPublicKeySize>;

  /**
   * 32-byte big-endian scalar added to a secret key
   */
  using Tweak = common::Hash256;
}  // namespace gorc::crypto::secp256k1
