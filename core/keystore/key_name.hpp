/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <string_view>

namespace gorc::keystore {

  constexpr size_t kMaxKeyNameLength = 128;

  /**
   * Key names become file names, so they are 1 to 128 printable ASCII
   * characters other than path separators. A leading dot is reserved for
   * temporary files.
   */
  bool isValidKeyName(std::string_view name);

}  // namespace gorc::keystore
