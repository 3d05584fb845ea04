/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include <fmt/format.h>

namespace gorc::keystore {

  /// Chains whose keys the keystore manages
  enum class Chain : uint8_t {
    Cosmos,
    Ethereum,
  };

  constexpr std::array kAllChains{Chain::Cosmos, Chain::Ethereum};

  /**
   * @return lower case chain name, used in records, logs and as AEAD
   * associated data
   */
  std::string_view toString(Chain chain);

  /**
   * @return record file extension for \param chain without the leading dot
   */
  std::string_view fileExtension(Chain chain);

  /**
   * Parses chain name as written in records ("cosmos", "ethereum") or as
   * typed on the command line ("eth")
   */
  std::optional<Chain> chainFromString(std::string_view str);

}  // namespace gorc::keystore

template <>
struct fmt::formatter<gorc::keystore::Chain>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(gorc::keystore::Chain chain, FormatContext &ctx) const {
    return fmt::formatter<std::string_view>::format(
        gorc::keystore::toString(chain), ctx);
  }
};
