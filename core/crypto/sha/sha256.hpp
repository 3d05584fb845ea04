/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace gorc::crypto {
  /// SHA-256 of the input, used for BIP39 checksums and address hashing
  common::Hash256 sha256(common::BufferView input);
}  // namespace gorc::crypto
