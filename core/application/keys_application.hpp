/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace gorc::application {

  /**
   * @class KeysApplication runs the configured key management command
   */
  class KeysApplication {
   public:
    virtual ~KeysApplication() = default;

    /**
     * @return process exit code, 0 on success and 1 on failure
     */
    virtual int run() = 0;
  };

}  // namespace gorc::application
