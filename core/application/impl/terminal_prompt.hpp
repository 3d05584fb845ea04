/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/prompt.hpp"

#include <iosfwd>

namespace gorc::application {

  /**
   * Reads from \p in, with echo turned off when it is the controlling
   * terminal. Prompts go to \p out.
   */
  class TerminalPrompt final : public Prompt {
   public:
    TerminalPrompt(std::istream &in, std::ostream &out);

    outcome::result<crypto::SecureString> readSecret(
        std::string_view message) override;

   private:
    std::istream &in_;
    std::ostream &out_;
  };

}  // namespace gorc::application
