/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/random_generator.hpp"
#include "log/logger.hpp"

namespace gorc::crypto {

  /**
   * CSPRNG reading the operating system entropy source through
   * boost::random::random_device
   */
  class BoostRandomGenerator : public CSPRNG {
   public:
    BoostRandomGenerator();

    outcome::result<void> fillRandomly(std::span<uint8_t> out) override;

   private:
    log::Logger logger_;
  };

}  // namespace gorc::crypto
