/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "keystore/key_record.hpp"
#include "outcome/outcome.hpp"

namespace gorc::keystore {

  /**
   * @brief Lazy cursor over records of one chain in directory order. Reads
   * one directory entry per step.
   */
  class RecordCursor {
   public:
    virtual ~RecordCursor() = default;

    /**
     * @brief (re)starts iteration
     * @return error if any, true if there is at least one entry
     */
    virtual outcome::result<bool> seekFirst() = 0;

    /**
     * @return true if the cursor points to an entry
     */
    virtual bool isValid() const = 0;

    /**
     * @brief Make step forward.
     */
    virtual outcome::result<void> next() = 0;

    /**
     * @return file name of the current entry
     */
    virtual std::string fileName() const = 0;

    /**
     * @return record of the current entry or the reason it can't be read
     */
    virtual outcome::result<KeyRecord> value() const = 0;
  };

  /**
   * @class RecordStore durable set of key records, one per name and chain
   */
  class RecordStore {
   public:
    virtual ~RecordStore() = default;

    /**
     * @brief persists \param record atomically
     * @return NAME_ALREADY_EXISTS if its name is taken for its chain
     */
    virtual outcome::result<void> add(const KeyRecord &record) = 0;

    /**
     * @return NOT_FOUND or CORRUPT_RECORD on failure
     */
    virtual outcome::result<KeyRecord> get(std::string_view name,
                                           Chain chain) const = 0;

    /**
     * @return metadata of readable records sorted by name, unreadable ones
     * listed separately
     */
    virtual outcome::result<ListResult> list(Chain chain) const = 0;

    virtual std::unique_ptr<RecordCursor> cursor(Chain chain) const = 0;

    /**
     * @brief relabels a record without touching its content
     */
    virtual outcome::result<void> rename(std::string_view old_name,
                                         std::string_view new_name,
                                         Chain chain) = 0;

    virtual outcome::result<void> remove(std::string_view name,
                                         Chain chain) = 0;

    virtual outcome::result<bool> exists(std::string_view name,
                                         Chain chain) const = 0;
  };

}  // namespace gorc::keystore
