/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cerrno>
#include <fstream>
#include <system_error>

#include "filesystem/common.hpp"
#include "outcome/outcome.hpp"

namespace gorc {

  template <typename T>
  concept StandardLayoutPointer =
      std::is_standard_layout_v<std::remove_pointer_t<T>>;

  template <typename T>
  concept ByteContainer =  //
      requires(T t, std::streampos pos) {
        { t.data() } -> StandardLayoutPointer;
        { t.size() } -> std::convertible_to<std::streamsize>;
        { t.resize(pos) };
        { t.clear() };
      };

  namespace detail {
    inline std::error_code readError() {
      return {errno != 0 ? errno : EIO, std::generic_category()};
    }
  }  // namespace detail

  /// files above this size are refused instead of read into memory
  constexpr std::streamoff kMaxReadFileSize = 1 << 20;

  /**
   * @brief reads whole file at \param path into \param out
   * @return errno based error, out is cleared on failure; file_too_large
   * for files above kMaxReadFileSize or without a size, like directories
   */
  template <ByteContainer Out>
  outcome::result<void> readFile(Out &out, const filesystem::path &path) {
    std::ifstream file{path, std::ios::binary | std::ios::ate};
    if (not file.good()) {
      out.clear();
      return detail::readError();
    }
    auto size = static_cast<std::streamoff>(file.tellg());
    if (size < 0 or size > kMaxReadFileSize) {
      out.clear();
      return std::make_error_code(std::errc::file_too_large);
    }
    out.resize(size);
    file.seekg(0);
    file.read(reinterpret_cast<char *>(out.data()), out.size());
    if (not file.good()) {
      out.clear();
      return detail::readError();
    }
    return outcome::success();
  }

}  // namespace gorc
