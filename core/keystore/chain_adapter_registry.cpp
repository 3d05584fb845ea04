/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "keystore/chain_adapter_registry.hpp"

#include <boost/assert.hpp>

#include "keystore/keystore_error.hpp"

namespace gorc::keystore {

  void ChainAdapterRegistry::registerAdapter(
      std::shared_ptr<ChainAdapter> adapter) {
    BOOST_ASSERT(adapter != nullptr);
    auto chain = adapter->chain();
    adapters_[chain] = std::move(adapter);
  }

  outcome::result<std::shared_ptr<ChainAdapter>> ChainAdapterRegistry::get(
      Chain chain) const {
    auto it = adapters_.find(chain);
    if (it == adapters_.end()) {
      return KeystoreError::UNSUPPORTED_CHAIN;
    }
    return it->second;
  }

  bool ChainAdapterRegistry::supports(Chain chain) const {
    return adapters_.contains(chain);
  }

}  // namespace gorc::keystore
