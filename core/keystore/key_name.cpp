/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "keystore/key_name.hpp"

#include <algorithm>

namespace gorc::keystore {

  bool isValidKeyName(std::string_view name) {
    if (name.empty() or name.size() > kMaxKeyNameLength) {
      return false;
    }
    if (name.front() == '.') {
      return false;
    }
    return std::ranges::all_of(name, [](char c) {
      return c >= 0x21 and c <= 0x7e and c != '/' and c != '\\';
    });
  }

}  // namespace gorc::keystore
