/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <string_view>

#include "crypto/bip39/const.hpp"

namespace gorc::crypto::bip39::english {
  /// BIP-0039 english wordlist, sorted
  extern const std::array<std::string_view, kDictionaryWords> dictionary;
}  // namespace gorc::crypto::bip39::english
