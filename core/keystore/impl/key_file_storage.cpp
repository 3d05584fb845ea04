/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "keystore/impl/key_file_storage.hpp"

#include <boost/assert.hpp>

#include <algorithm>

#include "keystore/key_name.hpp"
#include "keystore/keystore_error.hpp"
#include "keystore/record_codec.hpp"
#include "utils/read_file.hpp"
#include "utils/write_file.hpp"

namespace gorc::keystore {

  namespace {
    std::string fileSuffix(Chain chain) {
      return "." + std::string{fileExtension(chain)};
    }

    /**
     * @return key name if \param file_name is a record file of \param chain
     */
    std::optional<std::string> nameFromFileName(std::string_view file_name,
                                                Chain chain) {
      auto suffix = fileSuffix(chain);
      if (file_name.size() <= suffix.size() or file_name.front() == '.'
          or not file_name.ends_with(suffix)) {
        return std::nullopt;
      }
      return std::string{file_name.substr(0, file_name.size() - suffix.size())};
    }

    outcome::result<KeyRecord> readRecord(const filesystem::path &path,
                                          std::string name,
                                          Chain chain) {
      std::error_code ec;
      auto entry = filesystem::symlink_status(path, ec);
      if (not filesystem::exists(entry)) {
        if (ec and ec != std::errc::no_such_file_or_directory) {
          return KeystoreError::STORAGE_IO_ERROR;
        }
        return KeystoreError::NOT_FOUND;
      }
      // a directory or a dangling link under a record name holds no record
      if (not filesystem::is_regular_file(filesystem::status(path, ec))) {
        return KeystoreError::CORRUPT_RECORD;
      }
      std::string content;
      if (auto res = readFile(content, path); not res) {
        if (res.error() == std::errc::no_such_file_or_directory) {
          return KeystoreError::NOT_FOUND;
        }
        return KeystoreError::STORAGE_IO_ERROR;
      }
      return decodeRecord(content, std::move(name), chain);
    }

    class KeyFileCursor : public RecordCursor {
     public:
      KeyFileCursor(filesystem::path root, Chain chain)
          : root_{std::move(root)}, chain_{chain} {}

      outcome::result<bool> seekFirst() override {
        std::error_code ec;
        it_ = filesystem::directory_iterator{root_, ec};
        if (ec) {
          it_ = {};
          return ec;
        }
        OUTCOME_TRY(skipForeign());
        return isValid();
      }

      bool isValid() const override {
        return it_ != filesystem::directory_iterator{};
      }

      outcome::result<void> next() override {
        BOOST_ASSERT(isValid());
        std::error_code ec;
        it_.increment(ec);
        if (ec) {
          it_ = {};
          return ec;
        }
        return skipForeign();
      }

      std::string fileName() const override {
        BOOST_ASSERT(isValid());
        return it_->path().filename().string();
      }

      outcome::result<KeyRecord> value() const override {
        BOOST_ASSERT(isValid());
        auto file_name = fileName();
        auto name = nameFromFileName(file_name, chain_);
        BOOST_ASSERT(name.has_value());
        if (not isValidKeyName(*name)) {
          return KeystoreError::INVALID_NAME;
        }
        return readRecord(it_->path(), std::move(*name), chain_);
      }

     private:
      /// moves forward to the next record file of the chain
      outcome::result<void> skipForeign() {
        while (isValid()) {
          std::error_code ec;
          auto file_name = it_->path().filename().string();
          if (nameFromFileName(file_name, chain_).has_value()
              and it_->is_regular_file(ec)) {
            return outcome::success();
          }
          it_.increment(ec);
          if (ec) {
            it_ = {};
            return ec;
          }
        }
        return outcome::success();
      }

      filesystem::path root_;
      Chain chain_;
      filesystem::directory_iterator it_;
    };
  }  // namespace

  outcome::result<std::unique_ptr<KeyFileStorage>> KeyFileStorage::createAt(
      Path keystore_path) {
    std::error_code ec;
    if (not filesystem::is_directory(keystore_path, ec)) {
      auto logger = log::createLogger("KeyFileStorage", "record_store");
      SL_ERROR(logger,
               "Keystore path {} is not an existing directory",
               keystore_path);
      return KeystoreError::STORAGE_IO_ERROR;
    }
    std::unique_ptr<KeyFileStorage> kfs{
        new KeyFileStorage(std::move(keystore_path))};
    return kfs;
  }

  KeyFileStorage::KeyFileStorage(Path keystore_path)
      : keystore_path_{std::move(keystore_path)},
        logger_{log::createLogger("KeyFileStorage", "record_store")} {}

  KeyFileStorage::Path KeyFileStorage::composeKeyPath(std::string_view name,
                                                      Chain chain) const {
    return keystore_path_ / (std::string{name} + fileSuffix(chain));
  }

  outcome::result<void> KeyFileStorage::add(const KeyRecord &record) {
    if (not isValidKeyName(record.name)) {
      return KeystoreError::INVALID_NAME;
    }
    OUTCOME_TRY(taken, exists(record.name, record.chain));
    if (taken) {
      return KeystoreError::NAME_ALREADY_EXISTS;
    }

    auto path = composeKeyPath(record.name, record.chain);
    if (auto res = writeNewFile(path, encodeRecord(record)); not res) {
      if (res.error() == std::errc::file_exists) {
        return KeystoreError::NAME_ALREADY_EXISTS;
      }
      SL_ERROR(logger_,
               "Failed to write {} key {}: {}",
               record.chain,
               record.name,
               res.error().message());
      return KeystoreError::STORAGE_IO_ERROR;
    }
    SL_DEBUG(logger_, "Saved {} key {} to {}", record.chain, record.name, path);
    return outcome::success();
  }

  outcome::result<KeyRecord> KeyFileStorage::get(std::string_view name,
                                                 Chain chain) const {
    if (not isValidKeyName(name)) {
      return KeystoreError::INVALID_NAME;
    }
    auto path = composeKeyPath(name, chain);
    auto record = readRecord(path, std::string{name}, chain);
    if (not record) {
      if (record.error() == KeystoreError::NOT_FOUND
          or record.error() == KeystoreError::STORAGE_IO_ERROR) {
        return record.error();
      }
      SL_WARN(logger_,
              "{} key {} is corrupt: {}",
              chain,
              name,
              record.error().message());
      return KeystoreError::CORRUPT_RECORD;
    }
    return record;
  }

  std::unique_ptr<RecordCursor> KeyFileStorage::cursor(Chain chain) const {
    return std::make_unique<KeyFileCursor>(keystore_path_, chain);
  }

  outcome::result<ListResult> KeyFileStorage::list(Chain chain) const {
    auto cursor = this->cursor(chain);
    ListResult result;
    auto ok = cursor->seekFirst();
    if (not ok) {
      SL_ERROR(logger_,
               "Failed to read keystore directory {}: {}",
               keystore_path_,
               ok.error().message());
      return KeystoreError::STORAGE_IO_ERROR;
    }
    while (cursor->isValid()) {
      if (auto record = cursor->value()) {
        result.records.push_back(KeyRecordMeta{
            .name = std::move(record.value().name),
            .chain = record.value().chain,
            .address = std::move(record.value().address),
        });
      } else {
        SL_WARN(logger_,
                "Skipping unreadable key file {}: {}",
                cursor->fileName(),
                record.error().message());
        result.skipped.push_back(SkippedEntry{
            .file_name = cursor->fileName(),
            .error = record.error(),
        });
      }
      if (auto res = cursor->next(); not res) {
        SL_ERROR(logger_,
                 "Failed to read keystore directory {}: {}",
                 keystore_path_,
                 res.error().message());
        return KeystoreError::STORAGE_IO_ERROR;
      }
    }
    std::ranges::sort(result.records, {}, &KeyRecordMeta::name);
    std::ranges::sort(result.skipped, {}, &SkippedEntry::file_name);
    return result;
  }

  outcome::result<void> KeyFileStorage::rename(std::string_view old_name,
                                               std::string_view new_name,
                                               Chain chain) {
    if (not isValidKeyName(old_name) or not isValidKeyName(new_name)) {
      return KeystoreError::INVALID_NAME;
    }
    OUTCOME_TRY(present, exists(old_name, chain));
    if (not present) {
      return KeystoreError::NOT_FOUND;
    }
    if (old_name == new_name) {
      return outcome::success();
    }

    auto from = composeKeyPath(old_name, chain);
    auto to = composeKeyPath(new_name, chain);
    if (auto res = renameNoReplace(from, to); not res) {
      if (res.error() == std::errc::file_exists) {
        return KeystoreError::NAME_ALREADY_EXISTS;
      }
      if (res.error() == std::errc::no_such_file_or_directory) {
        return KeystoreError::NOT_FOUND;
      }
      SL_ERROR(logger_,
               "Failed to rename {} key {} to {}: {}",
               chain,
               old_name,
               new_name,
               res.error().message());
      return KeystoreError::STORAGE_IO_ERROR;
    }
    if (auto res = fsyncDirectory(keystore_path_); not res) {
      SL_ERROR(logger_,
               "Failed to sync {}: {}",
               keystore_path_,
               res.error().message());
      return KeystoreError::STORAGE_IO_ERROR;
    }
    SL_DEBUG(logger_, "Renamed {} key {} to {}", chain, old_name, new_name);
    return outcome::success();
  }

  outcome::result<void> KeyFileStorage::remove(std::string_view name,
                                               Chain chain) {
    if (not isValidKeyName(name)) {
      return KeystoreError::INVALID_NAME;
    }
    std::error_code ec;
    auto removed = filesystem::remove(composeKeyPath(name, chain), ec);
    if (ec) {
      SL_ERROR(logger_,
               "Failed to remove {} key {}: {}",
               chain,
               name,
               ec.message());
      return KeystoreError::STORAGE_IO_ERROR;
    }
    if (not removed) {
      return KeystoreError::NOT_FOUND;
    }
    if (auto res = fsyncDirectory(keystore_path_); not res) {
      SL_ERROR(logger_,
               "Failed to sync {}: {}",
               keystore_path_,
               res.error().message());
      return KeystoreError::STORAGE_IO_ERROR;
    }
    SL_DEBUG(logger_, "Removed {} key {}", chain, name);
    return outcome::success();
  }

  outcome::result<bool> KeyFileStorage::exists(std::string_view name,
                                               Chain chain) const {
    if (not isValidKeyName(name)) {
      return KeystoreError::INVALID_NAME;
    }
    std::error_code ec;
    auto status = filesystem::symlink_status(composeKeyPath(name, chain), ec);
    if (ec and ec != std::errc::no_such_file_or_directory) {
      SL_ERROR(logger_,
               "Failed to stat {} key {}: {}",
               chain,
               name,
               ec.message());
      return KeystoreError::STORAGE_IO_ERROR;
    }
    return filesystem::exists(status);
  }

}  // namespace gorc::keystore
