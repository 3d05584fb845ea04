/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>
#include <string_view>
#include <vector>

#include <boost/container_hash/hash.hpp>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"
#include "outcome/outcome.hpp"

namespace gorc::common {

  /**
   * @brief Class represents arbitrary (including empty) byte buffer.
   */
  template <typename Allocator = std::allocator<uint8_t>>
  class BasicBuffer : public std::vector<uint8_t, Allocator> {
   public:
    using Base = std::vector<uint8_t, Allocator>;

    BasicBuffer() = default;

    BasicBuffer(Base &&other) : Base(std::move(other)) {}

    BasicBuffer(const BufferView &s) : Base(s.begin(), s.end()) {}

    template <size_t N>
    explicit BasicBuffer(const std::array<uint8_t, N> &other)
        : Base(other.begin(), other.end()) {}

    using Base::Base;
    using Base::operator=;

    BasicBuffer &operator+=(const BufferView &view) {
      return put(view);
    }

    BasicBuffer &putUint8(uint8_t n) {
      Base::push_back(n);
      return *this;
    }

    /// Appends big-endian representation of \param n
    BasicBuffer &putUint32BE(uint32_t n) {
      for (int shift = 24; shift >= 0; shift -= 8) {
        Base::push_back(static_cast<uint8_t>(n >> shift));
      }
      return *this;
    }

    BasicBuffer &put(std::string_view view) {
      Base::insert(Base::end(), view.begin(), view.end());
      return *this;
    }

    BasicBuffer &put(const BufferView &view) {
      Base::insert(Base::end(), view.begin(), view.end());
      return *this;
    }

    BufferView view(size_t offset = 0, size_t length = -1) const {
      return std::span(*this).subspan(offset, length);
    }

    /**
     * @brief encode bytearray as hex
     * @return hex-encoded string
     */
    std::string toHex() const {
      return hex_lower(view());
    }

    /**
     * @brief Construct buffer from hex string
     * @param hex hex-encoded string
     * @return result containing constructed buffer if input string is
     * hex-encoded string.
     */
    static outcome::result<BasicBuffer> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return BasicBuffer(BufferView{bytes});
    }

    /**
     * @brief return content of bytearray as a string view
     * @note Does not ensure correct encoding
     */
    std::string_view asString() const {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return std::string_view(reinterpret_cast<const char *>(Base::data()),
                              Base::size());
    }

    /**
     * @brief stores content of a string to byte array
     */
    static BasicBuffer fromString(std::string_view src) {
      return BasicBuffer(src.begin(), src.end());
    }
  };

  using Buffer = BasicBuffer<>;

}  // namespace gorc::common

namespace gorc {
  using common::Buffer;
}  // namespace gorc

template <>
struct std::hash<gorc::common::Buffer> {
  size_t operator()(const gorc::common::Buffer &x) const {
    return boost::hash_range(x.begin(), x.end());
  }
};
