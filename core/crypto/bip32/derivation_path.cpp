/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bip32/derivation_path.hpp"

#include <charconv>

#include <fmt/format.h>

OUTCOME_CPP_DEFINE_CATEGORY(gorc::crypto::bip32, DerivationPathError, e) {
  using E = gorc::crypto::bip32::DerivationPathError;
  switch (e) {
    case E::MISSING_ROOT:
      return "derivation path must start with 'm'";
    case E::EMPTY_COMPONENT:
      return "derivation path contains an empty component";
    case E::INVALID_INDEX:
      return "derivation path component is not a number";
    case E::INDEX_OUT_OF_RANGE:
      return "derivation path index must be below 2^31";
  }
  return "unknown DerivationPathError";
}

namespace gorc::crypto::bip32 {

  outcome::result<DerivationPath> DerivationPath::parse(std::string_view path) {
    if (path.empty() or path.front() != 'm') {
      return DerivationPathError::MISSING_ROOT;
    }
    path.remove_prefix(1);

    std::vector<uint32_t> indices;
    while (not path.empty()) {
      if (path.front() != '/') {
        return DerivationPathError::MISSING_ROOT;
      }
      path.remove_prefix(1);

      auto slash_pos = path.find('/');
      auto component = path.substr(0, slash_pos);
      path.remove_prefix(component.size());
      if (component.empty()) {
        return DerivationPathError::EMPTY_COMPONENT;
      }

      bool hard = false;
      if (auto last = component.back(); last == '\'' or last == 'h'
                                        or last == 'H') {
        hard = true;
        component.remove_suffix(1);
      }

      uint32_t index = 0;
      auto end = component.data() + component.size();
      auto parsed = std::from_chars(component.data(), end, index);
      if (component.empty() or parsed.ec == std::errc::invalid_argument
          or parsed.ptr != end) {
        return DerivationPathError::INVALID_INDEX;
      }
      if (parsed.ec == std::errc::result_out_of_range
          or (index & kHardenedFlag) != 0) {
        return DerivationPathError::INDEX_OUT_OF_RANGE;
      }
      indices.push_back(hard ? (index | kHardenedFlag) : index);
    }
    return DerivationPath{std::move(indices)};
  }

  DerivationPath DerivationPath::bip44(uint32_t coin_type, uint32_t account) {
    return DerivationPath{{
        44 | kHardenedFlag,
        coin_type | kHardenedFlag,
        account | kHardenedFlag,
        0,
        0,
    }};
  }

  std::string DerivationPath::toString() const {
    std::string res = "m";
    for (auto index : indices_) {
      if ((index & kHardenedFlag) != 0) {
        res += fmt::format("/{}'", index & ~kHardenedFlag);
      } else {
        res += fmt::format("/{}", index);
      }
    }
    return res;
  }

}  // namespace gorc::crypto::bip32
