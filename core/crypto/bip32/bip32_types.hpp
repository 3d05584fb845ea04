/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "crypto/secp256k1_types.hpp"

namespace gorc::crypto::bip32 {

  struct ChainCodeTag;
  using ChainCode = PrivateKey<32, ChainCodeTag>;

  /**
   * Private half of a BIP-0032 extended key, depth and fingerprint are not
   * tracked since keys are never exported
   */
  struct ExtendedPrivateKey {
    secp256k1::SecretKey secret_key;
    ChainCode chain_code;
  };

}  // namespace gorc::crypto::bip32
