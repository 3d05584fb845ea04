/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "keystore/chain.hpp"

namespace gorc::keystore {

  std::string_view toString(Chain chain) {
    switch (chain) {
      case Chain::Cosmos:
        return "cosmos";
      case Chain::Ethereum:
        return "ethereum";
    }
    return "unknown";
  }

  std::string_view fileExtension(Chain chain) {
    switch (chain) {
      case Chain::Cosmos:
        return "cosmos.json";
      case Chain::Ethereum:
        return "eth.json";
    }
    return "unknown.json";
  }

  std::optional<Chain> chainFromString(std::string_view str) {
    if (str == "cosmos") {
      return Chain::Cosmos;
    }
    if (str == "ethereum" or str == "eth") {
      return Chain::Ethereum;
    }
    return std::nullopt;
  }

}  // namespace gorc::keystore
