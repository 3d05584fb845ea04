/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <ostream>

#include <fmt/format.h>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"

namespace gorc::common {

  enum class BlobError { INCORRECT_LENGTH = 1 };

  /**
   * Fixed-size byte string: digests, public keys, authentication tags.
   * Secret material does not live here, see crypto::PrivateKey.
   */
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
    using Array = std::array<uint8_t, size_>;

   public:
    constexpr Blob() : Array{} {}

    constexpr explicit Blob(const Array &l) : Array{l} {}

    static constexpr size_t size() {
      return size_;
    }

    BufferView view() const {
      return {this->data(), size_};
    }

    std::string toHex() const {
      return hex_lower(view());
    }

    /// @return INCORRECT_LENGTH unless hex decodes to exactly size_ bytes
    static outcome::result<Blob> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return fromSpan(bytes);
    }

    static outcome::result<Blob> fromSpan(BufferView span) {
      if (span.size() != size_) {
        return BlobError::INCORRECT_LENGTH;
      }
      Blob blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }
  };

  extern template class Blob<20ul>;
  extern template class Blob<32ul>;
  extern template class Blob<64ul>;

  /// RIPEMD-160, also the size of both address payloads
  using Hash160 = Blob<20>;
  using Hash256 = Blob<32>;
  using Hash512 = Blob<64>;

  template <size_t N>
  std::ostream &operator<<(std::ostream &os, const Blob<N> &blob) {
    return os << blob.toHex();
  }

}  // namespace gorc::common

template <size_t N>
struct fmt::formatter<gorc::common::Blob<N>> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin();
    if (it != ctx.end() && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const gorc::common::Blob<N> &blob, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "0x{}", blob.toHex());
  }
};

OUTCOME_HPP_DECLARE_ERROR(gorc::common, BlobError);
