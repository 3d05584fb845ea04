/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string_view>

#include "filesystem/common.hpp"
#include "outcome/outcome.hpp"

namespace gorc {

  /**
   * @brief renames \param from to \param to only if \param to doesn't exist,
   * fails with std::errc::file_exists otherwise
   * @note atomic where the filesystem supports RENAME_NOREPLACE, falls back
   * to renameIfAbsent elsewhere
   */
  outcome::result<void> renameNoReplace(const filesystem::path &from,
                                        const filesystem::path &to);

  /**
   * @brief renames \param from to \param to after checking that no entry
   * named \param to exists, fails with std::errc::file_exists otherwise
   * @note not atomic, a writer racing between the check and the rename can
   * still be replaced; either name holds the complete file at any moment
   */
  outcome::result<void> renameIfAbsent(const filesystem::path &from,
                                       const filesystem::path &to);

  /**
   * @brief flushes directory entries of \param dir to disk, so that renames
   * and unlinks inside it survive a crash
   */
  outcome::result<void> fsyncDirectory(const filesystem::path &dir);

  /**
   * Wrapper to generate tmp file name and rename it later.
   * Readers must never see a partially written file, so it is written to a
   * tmp file first and atomically renamed once completely written and synced.
   * Tmp file is created in same directory as target path, to avoid `EXDEV`
   * error from `rename`, and its name starts with a dot so directory
   * listings skip it.
   */
  class TmpFile {
   public:
    /**
     * Generate tmp file name for path.
     */
    static outcome::result<TmpFile> make(filesystem::path target);

    TmpFile(TmpFile &&other) noexcept;
    TmpFile &operator=(TmpFile &&) = delete;
    TmpFile(const TmpFile &) = delete;
    TmpFile &operator=(const TmpFile &) = delete;

    /// removes tmp file unless it was renamed
    ~TmpFile();

    /**
     * Get current file path.
     */
    filesystem::path path() const;

    /**
     * @brief creates tmp file with owner only permissions, writes
     * \param data and syncs it
     */
    outcome::result<void> write(std::string_view data);

    /**
     * @brief moves tmp file to target name, fails if target exists
     */
    outcome::result<void> commit();

   private:
    TmpFile(filesystem::path target, filesystem::path tmp);

    filesystem::path target_;
    std::optional<filesystem::path> tmp_;
  };

  /**
   * @brief crash safe creation of a new file with \param data, owner only
   * permissions; fails with std::errc::file_exists if \param path exists
   */
  outcome::result<void> writeNewFile(const filesystem::path &path,
                                     std::string_view data);

}  // namespace gorc
