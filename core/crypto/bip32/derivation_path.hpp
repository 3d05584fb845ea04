/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace gorc::crypto::bip32 {

  enum class DerivationPathError {
    MISSING_ROOT = 1,
    EMPTY_COMPONENT,
    INVALID_INDEX,
    INDEX_OUT_OF_RANGE,
  };

  constexpr uint32_t kHardenedFlag = 0x80000000u;

  /**
   * BIP-0032 path from the master key, e.g. m/44'/60'/0'/0/0
   */
  class DerivationPath {
   public:
    DerivationPath() = default;

    explicit DerivationPath(std::vector<uint32_t> indices)
        : indices_{std::move(indices)} {}

    /**
     * @brief parses path in "m/a/b'/c" form, hardened components may be
     * marked with ', h or H
     */
    static outcome::result<DerivationPath> parse(std::string_view path);

    /**
     * @brief m/44'/coin'/account'/0/0
     */
    static DerivationPath bip44(uint32_t coin_type, uint32_t account);

    const std::vector<uint32_t> &indices() const {
      return indices_;
    }

    /// canonical form with ' marking hardened components
    std::string toString() const;

    bool operator==(const DerivationPath &) const = default;

   private:
    std::vector<uint32_t> indices_;
  };

}  // namespace gorc::crypto::bip32

OUTCOME_HPP_DECLARE_ERROR(gorc::crypto::bip32, DerivationPathError);
