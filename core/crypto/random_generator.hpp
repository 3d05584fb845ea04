/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>

#include "outcome/outcome.hpp"

namespace gorc::crypto {

  enum class RandomGeneratorError : uint8_t {
    SOURCE_UNAVAILABLE = 1,
  };

  /**
   * @class CSPRNG provides interface to cryptographic-secure random bytes
   * generator
   */
  class CSPRNG {
   public:
    virtual ~CSPRNG() = default;

    /**
     * @brief fills \param out with random bytes
     * @return error if the underlying entropy source can't be read
     */
    virtual outcome::result<void> fillRandomly(std::span<uint8_t> out) = 0;
  };

}  // namespace gorc::crypto

OUTCOME_HPP_DECLARE_ERROR(gorc::crypto, RandomGeneratorError);
