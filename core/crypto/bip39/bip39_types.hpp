/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "crypto/bip39/const.hpp"
#include "crypto/common.hpp"

namespace gorc::crypto::bip39 {
  struct Bip39Tag;
  using Bip39Seed = PrivateKey<constants::BIP39_SEED_LEN_512, Bip39Tag>;

  using Words = std::vector<std::string>;
}  // namespace gorc::crypto::bip39
