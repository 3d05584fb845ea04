/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "crypto/common.hpp"
#include "outcome/outcome.hpp"

namespace gorc::application {

  enum class PromptError {
    INPUT_CLOSED = 1,
    TERMINAL_ERROR,
  };

  /**
   * @class Prompt asks the operator for secrets: passphrases, mnemonics
   */
  class Prompt {
   public:
    virtual ~Prompt() = default;

    /**
     * @brief shows \param message and reads one line without echoing it
     * @return the line without its line terminator
     */
    virtual outcome::result<crypto::SecureString> readSecret(
        std::string_view message) = 0;
  };

}  // namespace gorc::application

OUTCOME_HPP_DECLARE_ERROR(gorc::application, PromptError);
