/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>

#include "keystore/chain_adapter.hpp"

namespace gorc::keystore {

  /**
   * Adapters by chain. A new chain is supported by registering one more
   * adapter, nothing else changes.
   */
  class ChainAdapterRegistry {
   public:
    /// replaces adapter previously registered for the same chain
    void registerAdapter(std::shared_ptr<ChainAdapter> adapter);

    /**
     * @return adapter for \param chain or UNSUPPORTED_CHAIN
     */
    outcome::result<std::shared_ptr<ChainAdapter>> get(Chain chain) const;

    bool supports(Chain chain) const;

   private:
    std::map<Chain, std::shared_ptr<ChainAdapter>> adapters_;
  };

}  // namespace gorc::keystore
