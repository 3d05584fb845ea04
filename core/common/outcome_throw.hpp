/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>

#include <boost/throw_exception.hpp>

#include "outcome/outcome.hpp"

namespace gorc::common {
  /**
   * @brief throws an outcome error as std::system_error, for the places
   * (injector factories) that can't return outcome::result
   * @param ec error carried by a failed outcome::result
   */
  [[noreturn]] inline void raise(const std::error_code &ec) {
    boost::throw_exception(std::system_error(ec));
  }
}  // namespace gorc::common
