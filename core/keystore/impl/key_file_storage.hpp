/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "keystore/record_store.hpp"

#include "filesystem/common.hpp"
#include "log/logger.hpp"

namespace gorc::keystore {

  /**
   * Record store keeping every record in its own file
   * `<root>/<name>.<chain extension>`. Files are created through a hidden
   * tmp file and a no-replace rename, so a record is either complete or
   * absent.
   */
  class KeyFileStorage : public RecordStore {
   public:
    using Path = filesystem::path;

    /**
     * Opens key storage at the given \param keystore_path, which must be an
     * existing directory. The directory is never created.
     */
    static outcome::result<std::unique_ptr<KeyFileStorage>> createAt(
        Path keystore_path);

    outcome::result<void> add(const KeyRecord &record) override;

    outcome::result<KeyRecord> get(std::string_view name,
                                   Chain chain) const override;

    outcome::result<ListResult> list(Chain chain) const override;

    std::unique_ptr<RecordCursor> cursor(Chain chain) const override;

    outcome::result<void> rename(std::string_view old_name,
                                 std::string_view new_name,
                                 Chain chain) override;

    outcome::result<void> remove(std::string_view name, Chain chain) override;

    outcome::result<bool> exists(std::string_view name,
                                 Chain chain) const override;

    const Path &root() const {
      return keystore_path_;
    }

    Path composeKeyPath(std::string_view name, Chain chain) const;

   private:
    explicit KeyFileStorage(Path keystore_path);

    Path keystore_path_;
    log::Logger logger_;
  };

}  // namespace gorc::keystore
