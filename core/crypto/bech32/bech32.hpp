/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

/**
 * BIP-0173 bech32 (original checksum constant, not bech32m) over arbitrary
 * byte payloads, as used by Cosmos SDK account addresses
 */
namespace gorc::crypto::bech32 {

  enum class Bech32Error {
    INVALID_HRP = 1,
    TOO_LONG,
    MIXED_CASE,
    MISSING_SEPARATOR,
    INVALID_CHARACTER,
    INVALID_CHECKSUM,
    INVALID_PADDING,
  };

  /// Maximum length of an encoded string
  constexpr size_t kMaxLength = 90;

  struct Decoded {
    std::string hrp;
    common::Buffer data;
  };

  /**
   * @brief encodes \param data regrouped to 5-bit words under human readable
   * part \param hrp
   * @return lower case bech32 string
   */
  outcome::result<std::string> encode(std::string_view hrp,
                                      common::BufferView data);

  /**
   * @brief decodes either all lower case or all upper case bech32 string
   * @return lower case hrp and the payload regrouped back to bytes
   */
  outcome::result<Decoded> decode(std::string_view str);

}  // namespace gorc::crypto::bech32

OUTCOME_HPP_DECLARE_ERROR(gorc::crypto::bech32, Bech32Error);
