/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <string_view>

namespace gorc::crypto::bip39 {
  /// each mnemonic word encodes 11 bits of entropy and checksum
  constexpr size_t kWordBits = 11;
  constexpr size_t kDictionaryWords = 1 << kWordBits;

  namespace constants {
    constexpr size_t BIP39_SEED_LEN_512 = 64u;
    constexpr size_t BIP39_ITERATIONS = 2048u;
    constexpr std::string_view BIP39_SALT_PREFIX = "mnemonic";
  }  // namespace constants
}  // namespace gorc::crypto::bip39
