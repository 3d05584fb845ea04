/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "keystore/impl/key_file_storage.hpp"

#include <algorithm>
#include <fstream>

#include <gtest/gtest.h>

#include "keystore/keystore_error.hpp"
#include "keystore/record_codec.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/storage/base_fs_test.hpp"

using namespace gorc::keystore;
using gorc::common::Buffer;

namespace {
  KeyRecord makeRecord(std::string name, Chain chain) {
    KeyRecord record{
        .name = std::move(name),
        .chain = chain,
        .public_key = Buffer(chain == Chain::Cosmos ? 33 : 65, 0x02),
        .address = chain == Chain::Cosmos ? "cosmos1test" : "0xtest",
        .encrypted_secret =
            EncryptedSecret{
                .version = 1,
                .kdf = "scrypt",
                .kdf_params = {.n = 1024, .r = 8, .p = 1},
                .dklen = 32,
                .salt = Buffer(32, 0x11),
                .cipher = "aes-256-gcm",
                .nonce = Buffer(12, 0x22),
                .ciphertext = Buffer(48, 0x33),
            },
        .derivation_path = std::nullopt,
    };
    return record;
  }

  void writeRaw(const fs::path &path, std::string_view content) {
    std::ofstream file{path};
    file << content;
  }
}  // namespace

class KeyFileStorageTest : public test::BaseFS_Test {
 public:
  KeyFileStorageTest()
      : test::BaseFS_Test("/tmp/gorc_key_file_storage_test") {}

  void SetUp() override {
    BaseFS_Test::SetUp();
    auto storage_res = KeyFileStorage::createAt(base_path);
    ASSERT_TRUE(storage_res) << storage_res.error().message();
    storage = std::move(storage_res.value());
  }

  std::unique_ptr<KeyFileStorage> storage;
};

/**
 * @given path of a directory that doesn't exist
 * @when storage opened there
 * @then STORAGE_IO_ERROR is returned and nothing is created
 */
TEST_F(KeyFileStorageTest, CreateAtMissingDirectory) {
  auto missing = base_path / "missing";
  EXPECT_EC(KeyFileStorage::createAt(missing),
            KeystoreError::STORAGE_IO_ERROR);
  EXPECT_FALSE(fs::exists(missing));
}

/**
 * @given empty storage
 * @when record added
 * @then it is read back unchanged from <name>.cosmos.json, which only the
 * owner can access, and no tmp file is left behind
 */
TEST_F(KeyFileStorageTest, AddAndGet) {
  auto record = makeRecord("alice", Chain::Cosmos);
  record.derivation_path = "m/44'/118'/0'/0/0";
  EXPECT_OUTCOME_TRUE_1(storage->add(record));

  EXPECT_EQ(listDirectory(), std::vector<std::string>{"alice.cosmos.json"});
  auto perms = fs::status(base_path / "alice.cosmos.json").permissions();
  EXPECT_EQ(perms, fs::perms::owner_read | fs::perms::owner_write);

  EXPECT_OUTCOME_TRUE(stored, storage->get("alice", Chain::Cosmos));
  EXPECT_EQ(stored, record);
  EXPECT_OUTCOME_TRUE(present, storage->exists("alice", Chain::Cosmos));
  EXPECT_TRUE(present);
}

/**
 * @given stored cosmos record
 * @when record of the same name added for cosmos and for ethereum
 * @then cosmos add fails with NAME_ALREADY_EXISTS, ethereum one succeeds
 */
TEST_F(KeyFileStorageTest, NamesAreUniquePerChain) {
  EXPECT_OUTCOME_TRUE_1(storage->add(makeRecord("alice", Chain::Cosmos)));
  EXPECT_EC(storage->add(makeRecord("alice", Chain::Cosmos)),
            KeystoreError::NAME_ALREADY_EXISTS);
  EXPECT_OUTCOME_TRUE_1(storage->add(makeRecord("alice", Chain::Ethereum)));
  EXPECT_EQ(listDirectory(),
            (std::vector<std::string>{"alice.cosmos.json", "alice.eth.json"}));
}

/**
 * @given names that could escape the directory or hide a file
 * @when used with any operation
 * @then INVALID_NAME is returned
 */
TEST_F(KeyFileStorageTest, InvalidNames) {
  EXPECT_EC(storage->add(makeRecord("../evil", Chain::Cosmos)),
            KeystoreError::INVALID_NAME);
  EXPECT_EC(storage->add(makeRecord(".hidden", Chain::Cosmos)),
            KeystoreError::INVALID_NAME);
  EXPECT_EC(storage->add(makeRecord("", Chain::Cosmos)),
            KeystoreError::INVALID_NAME);
  EXPECT_EC(storage->get("a/b", Chain::Cosmos), KeystoreError::INVALID_NAME);
  EXPECT_EC(storage->exists("a/b", Chain::Cosmos),
            KeystoreError::INVALID_NAME);
  EXPECT_EC(storage->remove("..", Chain::Cosmos), KeystoreError::INVALID_NAME);
  EXPECT_TRUE(listDirectory().empty());
}

/**
 * @given empty storage
 * @when absent record requested or removed
 * @then NOT_FOUND is returned
 */
TEST_F(KeyFileStorageTest, Missing) {
  EXPECT_EC(storage->get("nobody", Chain::Cosmos), KeystoreError::NOT_FOUND);
  EXPECT_EC(storage->remove("nobody", Chain::Cosmos),
            KeystoreError::NOT_FOUND);
  EXPECT_OUTCOME_TRUE(present, storage->exists("nobody", Chain::Cosmos));
  EXPECT_FALSE(present);
}

/**
 * @given directory with records of both chains, a leftover tmp file, a
 * foreign file, a directory and a corrupt record
 * @when cosmos records listed
 * @then only cosmos records are returned sorted by name, the corrupt one is
 * reported as skipped
 */
TEST_F(KeyFileStorageTest, List) {
  EXPECT_OUTCOME_TRUE_1(storage->add(makeRecord("zed", Chain::Cosmos)));
  EXPECT_OUTCOME_TRUE_1(storage->add(makeRecord("alice", Chain::Cosmos)));
  EXPECT_OUTCOME_TRUE_1(storage->add(makeRecord("bob", Chain::Ethereum)));
  writeRaw(base_path / ".carol.cosmos.json.tmp-12345678", "partial");
  writeRaw(base_path / "notes.txt", "hello");
  writeRaw(base_path / "broken.cosmos.json", "{ not json");
  fs::create_directory(base_path / "dir.cosmos.json");

  EXPECT_OUTCOME_TRUE(cosmos, storage->list(Chain::Cosmos));
  ASSERT_EQ(cosmos.records.size(), 2);
  EXPECT_EQ(cosmos.records[0].name, "alice");
  EXPECT_EQ(cosmos.records[0].chain, Chain::Cosmos);
  EXPECT_EQ(cosmos.records[0].address, "cosmos1test");
  EXPECT_EQ(cosmos.records[1].name, "zed");
  ASSERT_EQ(cosmos.skipped.size(), 1);
  EXPECT_EQ(cosmos.skipped[0].file_name, "broken.cosmos.json");
  EXPECT_EQ(cosmos.skipped[0].error, RecordCodecError::MALFORMED_JSON);

  EXPECT_OUTCOME_TRUE(eth, storage->list(Chain::Ethereum));
  ASSERT_EQ(eth.records.size(), 1);
  EXPECT_EQ(eth.records[0].name, "bob");
  EXPECT_TRUE(eth.skipped.empty());
}

/**
 * @given record file with a cosmos extension and ethereum content
 * @when requested by name
 * @then CORRUPT_RECORD is returned
 */
TEST_F(KeyFileStorageTest, CorruptRecord) {
  EXPECT_OUTCOME_TRUE_1(storage->add(makeRecord("bob", Chain::Ethereum)));
  fs::copy_file(base_path / "bob.eth.json", base_path / "bob.cosmos.json");
  EXPECT_EC(storage->get("bob", Chain::Cosmos),
            KeystoreError::CORRUPT_RECORD);

  EXPECT_OUTCOME_TRUE(listed, storage->list(Chain::Cosmos));
  EXPECT_TRUE(listed.records.empty());
  ASSERT_EQ(listed.skipped.size(), 1);
  EXPECT_EQ(listed.skipped[0].error, RecordCodecError::CHAIN_MISMATCH);
}

/**
 * @given directory and dangling symlink named like cosmos records
 * @when requested by name
 * @then CORRUPT_RECORD is returned and listing skips both entries
 */
TEST_F(KeyFileStorageTest, NonRegularEntries) {
  fs::create_directory(base_path / "dir.cosmos.json");
  fs::create_symlink(base_path / "missing", base_path / "link.cosmos.json");

  EXPECT_EC(storage->get("dir", Chain::Cosmos),
            KeystoreError::CORRUPT_RECORD);
  EXPECT_EC(storage->get("link", Chain::Cosmos),
            KeystoreError::CORRUPT_RECORD);

  EXPECT_OUTCOME_TRUE(listed, storage->list(Chain::Cosmos));
  EXPECT_TRUE(listed.records.empty());
  EXPECT_TRUE(listed.skipped.empty());
}

/**
 * @given stored records alice and bob
 * @when renamed
 * @then rename to a free name moves the file, a taken name or an absent
 * source is refused, renaming to itself does nothing
 */
TEST_F(KeyFileStorageTest, Rename) {
  EXPECT_OUTCOME_TRUE_1(storage->add(makeRecord("alice", Chain::Cosmos)));
  EXPECT_OUTCOME_TRUE_1(storage->add(makeRecord("bob", Chain::Cosmos)));

  EXPECT_OUTCOME_TRUE_1(storage->rename("alice", "carol", Chain::Cosmos));
  EXPECT_EQ(listDirectory(),
            (std::vector<std::string>{"bob.cosmos.json", "carol.cosmos.json"}));
  EXPECT_OUTCOME_TRUE(carol, storage->get("carol", Chain::Cosmos));
  EXPECT_EQ(carol.name, "carol");

  EXPECT_EC(storage->rename("carol", "bob", Chain::Cosmos),
            KeystoreError::NAME_ALREADY_EXISTS);
  EXPECT_EC(storage->rename("alice", "dave", Chain::Cosmos),
            KeystoreError::NOT_FOUND);
  EXPECT_EC(storage->rename("bob", "../x", Chain::Cosmos),
            KeystoreError::INVALID_NAME);
  EXPECT_OUTCOME_TRUE_1(storage->rename("bob", "bob", Chain::Cosmos));
  EXPECT_EQ(listDirectory(),
            (std::vector<std::string>{"bob.cosmos.json", "carol.cosmos.json"}));
}

/**
 * @given stored record
 * @when removed twice
 * @then first removal deletes the file, second returns NOT_FOUND
 */
TEST_F(KeyFileStorageTest, Remove) {
  EXPECT_OUTCOME_TRUE_1(storage->add(makeRecord("alice", Chain::Cosmos)));
  EXPECT_OUTCOME_TRUE_1(storage->remove("alice", Chain::Cosmos));
  EXPECT_TRUE(listDirectory().empty());
  EXPECT_EC(storage->remove("alice", Chain::Cosmos), KeystoreError::NOT_FOUND);
}

/**
 * @given storage with two records
 * @when walked with a cursor
 * @then each record file is visited once
 */
TEST_F(KeyFileStorageTest, Cursor) {
  EXPECT_OUTCOME_TRUE_1(storage->add(makeRecord("alice", Chain::Ethereum)));
  EXPECT_OUTCOME_TRUE_1(storage->add(makeRecord("bob", Chain::Ethereum)));
  writeRaw(base_path / "readme.md", "");

  auto cursor = storage->cursor(Chain::Ethereum);
  EXPECT_OUTCOME_TRUE(has_entries, cursor->seekFirst());
  EXPECT_TRUE(has_entries);
  std::vector<std::string> names;
  while (cursor->isValid()) {
    EXPECT_OUTCOME_TRUE(record, cursor->value());
    names.push_back(record.name);
    EXPECT_OUTCOME_TRUE_1(cursor->next());
  }
  std::ranges::sort(names);
  EXPECT_EQ(names, (std::vector<std::string>{"alice", "bob"}));
}
