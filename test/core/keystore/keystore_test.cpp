/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "keystore/impl/keystore_impl.hpp"

#include <algorithm>
#include <fstream>

#include <gtest/gtest.h>

#include <boost/algorithm/string/replace.hpp>

#include "crypto/aes/impl/aes_gcm_provider_impl.hpp"
#include "crypto/bip32/impl/bip32_provider_impl.hpp"
#include "crypto/bip39/impl/bip39_provider_impl.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "crypto/pbkdf2/impl/pbkdf2_provider_impl.hpp"
#include "crypto/random_generator/boost_generator.hpp"
#include "crypto/scrypt/impl/scrypt_provider_impl.hpp"
#include "crypto/secp256k1/secp256k1_provider_impl.hpp"
#include "keystore/adapters/cosmos_adapter.hpp"
#include "keystore/adapters/ethereum_adapter.hpp"
#include "keystore/impl/derivation_engine_impl.hpp"
#include "keystore/impl/key_file_storage.hpp"
#include "keystore/impl/secret_codec_impl.hpp"
#include "keystore/keystore_error.hpp"
#include "testutil/outcome.hpp"
#include "testutil/storage/base_fs_test.hpp"
#include "utils/read_file.hpp"

using namespace gorc::keystore;
using namespace gorc::crypto;

namespace {
  constexpr std::string_view kAbandon =
      "abandon abandon abandon abandon abandon abandon abandon abandon "
      "abandon abandon abandon about";
  constexpr std::string_view kTestJunk =
      "test test test test test test test test test test test junk";
  constexpr std::string_view kPassphrase = "correct horse";
}  // namespace

class KeystoreTest : public test::BaseFS_Test {
 public:
  KeystoreTest() : test::BaseFS_Test("/tmp/gorc_keystore_test") {}

  void SetUp() override {
    BaseFS_Test::SetUp();

    auto random = std::make_shared<BoostRandomGenerator>();
    auto hasher = std::make_shared<HasherImpl>();
    auto secp256k1 = std::make_shared<Secp256k1ProviderImpl>();
    auto adapters = std::make_shared<ChainAdapterRegistry>();
    adapters->registerAdapter(
        std::make_shared<CosmosAdapter>(hasher, secp256k1));
    adapters->registerAdapter(
        std::make_shared<EthereumAdapter>(hasher, secp256k1));

    auto engine = std::make_shared<DerivationEngineImpl>(
        random,
        std::make_shared<Bip39ProviderImpl>(
            std::make_shared<Pbkdf2ProviderImpl>()),
        std::make_shared<Bip32ProviderImpl>(hasher, secp256k1),
        adapters);
    auto codec = std::make_shared<SecretCodecImpl>(
        random,
        std::make_shared<ScryptProviderImpl>(),
        std::make_shared<AesGcmProviderImpl>(),
        ScryptParams{.n = 1024, .r = 8, .p = 1});

    auto storage = KeyFileStorage::createAt(base_path);
    ASSERT_TRUE(storage) << storage.error().message();
    keystore = std::make_shared<KeystoreImpl>(
        engine, adapters, codec, std::move(storage.value()));
  }

  std::string readKeyFile(const std::string &file_name) {
    std::string content;
    auto res = gorc::readFile(content, base_path / file_name);
    EXPECT_TRUE(res) << res.error().message();
    return content;
  }

  void writeKeyFile(const std::string &file_name, std::string_view content) {
    fs::remove(base_path / file_name);
    std::ofstream file{base_path / file_name};
    file << content;
  }

  std::shared_ptr<KeystoreImpl> keystore;
};

/**
 * @given empty keystore
 * @when development mnemonic imported as an Ethereum key
 * @then well known address is stored with its derivation path and can be
 * shown with the passphrase
 */
TEST_F(KeystoreTest, ImportEthereumMnemonic) {
  EXPECT_OUTCOME_TRUE(
      info,
      keystore->importMnemonic(
          "dev", Chain::Ethereum, kTestJunk, kPassphrase, {}));
  EXPECT_EQ(info.name, "dev");
  EXPECT_EQ(info.chain, Chain::Ethereum);
  EXPECT_EQ(info.address, "0xf39Fd6e51aad88F6F4ce6aB8827279cffFb92266");
  EXPECT_EQ(info.public_key.size(), 65);
  EXPECT_EQ(info.derivation_path, "m/44'/60'/0'/0/0");
  EXPECT_EQ(listDirectory(), std::vector<std::string>{"dev.eth.json"});

  auto content = readKeyFile("dev.eth.json");
  EXPECT_NE(content.find("0xf39Fd6e51aad88F6F4ce6aB8827279cffFb92266"),
            std::string::npos);
  EXPECT_EQ(content.find("ac0974bec39a17e36ba4a6b4d238ff944bacb478"),
            std::string::npos);

  EXPECT_OUTCOME_TRUE(shown,
                      keystore->show("dev", Chain::Ethereum, kPassphrase));
  EXPECT_EQ(shown, info);
}

/**
 * @given empty keystore
 * @when mnemonic imported as Cosmos keys for accounts 0 and 1
 * @then addresses of both accounts are distinct bech32 addresses
 */
TEST_F(KeystoreTest, ImportCosmosMnemonic) {
  EXPECT_OUTCOME_TRUE(
      first,
      keystore->importMnemonic(
          "orchestrator", Chain::Cosmos, kAbandon, kPassphrase, {}));
  EXPECT_EQ(first.address, "cosmos19rl4cm2hmr8afy4kldpxz3fka4jguq0auqdal4");
  EXPECT_EQ(first.public_key.size(), 33);

  DerivationOptions options;
  options.account_index = 1;
  EXPECT_OUTCOME_TRUE(
      second,
      keystore->importMnemonic(
          "second", Chain::Cosmos, kAbandon, kPassphrase, options));
  EXPECT_EQ(second.address, "cosmos1tehv5km5e9y706rc2gzk9yyun9dljjjnvyt3u0");
  EXPECT_EQ(second.derivation_path, "m/44'/118'/1'/0/0");
}

/**
 * @given keystore
 * @when random keys added for both chains
 * @then they are listed per chain without derivation paths and decrypt only
 * with the right passphrase
 */
TEST_F(KeystoreTest, AddRandom) {
  EXPECT_OUTCOME_TRUE(cosmos, keystore->add("val", Chain::Cosmos, "pw"));
  EXPECT_TRUE(cosmos.address.starts_with("cosmos1"));
  EXPECT_FALSE(cosmos.derivation_path.has_value());
  EXPECT_OUTCOME_TRUE(eth, keystore->add("val", Chain::Ethereum, "pw"));
  EXPECT_TRUE(eth.address.starts_with("0x"));
  EXPECT_EQ(eth.address.size(), 42);

  EXPECT_OUTCOME_TRUE(listed, keystore->list(Chain::Cosmos));
  ASSERT_EQ(listed.records.size(), 1);
  EXPECT_EQ(listed.records[0].name, "val");
  EXPECT_EQ(listed.records[0].address, cosmos.address);

  EXPECT_OUTCOME_TRUE(shown, keystore->show("val", Chain::Cosmos, "pw"));
  EXPECT_EQ(shown, cosmos);
  EXPECT_EC(keystore->show("val", Chain::Cosmos, "wrong"),
            KeystoreError::DECRYPTION_FAILED);
}

/**
 * @given keystore
 * @when key added with a generated mnemonic and the mnemonic imported again
 * under another name
 * @then both keys have the same address
 */
TEST_F(KeystoreTest, AddWithMnemonic) {
  EXPECT_OUTCOME_TRUE(
      added, keystore->addWithMnemonic("eth", Chain::Ethereum, "pw", 24));
  std::string_view phrase{added.mnemonic.data(), added.mnemonic.size()};
  EXPECT_EQ(std::ranges::count(phrase, ' '), 23);
  EXPECT_EQ(added.info.derivation_path, "m/44'/60'/0'/0/0");

  EXPECT_OUTCOME_TRUE(
      restored,
      keystore->importMnemonic("restored", Chain::Ethereum, phrase, "pw", {}));
  EXPECT_EQ(restored.address, added.info.address);

  EXPECT_EC(keystore->addWithMnemonic("other", Chain::Ethereum, "pw", 13),
            DerivationEngineError::UNSUPPORTED_WORD_COUNT);
}

/**
 * @given empty keystore
 * @when a 13 word phrase and a 12 word phrase with a wrong checksum imported
 * @then INVALID_MNEMONIC is returned and nothing is written
 */
TEST_F(KeystoreTest, ImportInvalidMnemonic) {
  std::string thirteen{kAbandon};
  thirteen += " abandon";
  EXPECT_EC(keystore->importMnemonic(
                "thirteen", Chain::Cosmos, thirteen, "pw", {}),
            KeystoreError::INVALID_MNEMONIC);

  std::string bad_checksum{kAbandon};
  boost::algorithm::replace_last(bad_checksum, "about", "abandon");
  EXPECT_EC(keystore->importMnemonic(
                "checksum", Chain::Ethereum, bad_checksum, "pw", {}),
            KeystoreError::INVALID_MNEMONIC);

  EXPECT_TRUE(listDirectory().empty());
}

/**
 * @given stored key
 * @when shown with a wrong passphrase and then with the right one
 * @then first attempt fails with DECRYPTION_FAILED, second succeeds and the
 * key file is left untouched
 */
TEST_F(KeystoreTest, WrongPassphraseKeepsFile) {
  EXPECT_OUTCOME_TRUE(
      info,
      keystore->importMnemonic(
          "dev", Chain::Ethereum, kTestJunk, kPassphrase, {}));
  auto before = readKeyFile("dev.eth.json");

  EXPECT_EC(keystore->show("dev", Chain::Ethereum, "incorrect horse"),
            KeystoreError::DECRYPTION_FAILED);
  EXPECT_OUTCOME_TRUE(shown,
                      keystore->show("dev", Chain::Ethereum, kPassphrase));
  EXPECT_EQ(shown, info);

  EXPECT_EQ(readKeyFile("dev.eth.json"), before);
  EXPECT_EQ(listDirectory(), std::vector<std::string>{"dev.eth.json"});
}

/**
 * @given stored key
 * @when key of the same name added or an invalid name used
 * @then NAME_ALREADY_EXISTS or INVALID_NAME is returned and no file appears
 */
TEST_F(KeystoreTest, NameChecks) {
  EXPECT_OUTCOME_TRUE_1(keystore->add("taken", Chain::Cosmos, "pw"));
  EXPECT_EC(keystore->add("taken", Chain::Cosmos, "pw"),
            KeystoreError::NAME_ALREADY_EXISTS);
  EXPECT_EC(keystore->importMnemonic(
                "taken", Chain::Cosmos, kAbandon, "pw", {}),
            KeystoreError::NAME_ALREADY_EXISTS);
  EXPECT_EC(keystore->add("../up", Chain::Cosmos, "pw"),
            KeystoreError::INVALID_NAME);
  EXPECT_EC(keystore->rename("taken", "a/b", Chain::Cosmos),
            KeystoreError::INVALID_NAME);
  EXPECT_EQ(listDirectory(), std::vector<std::string>{"taken.cosmos.json"});
}

/**
 * @given stored key
 * @when renamed and then deleted
 * @then it decrypts under its new name and is gone after deletion
 */
TEST_F(KeystoreTest, RenameAndRemove) {
  EXPECT_OUTCOME_TRUE(
      info,
      keystore->importMnemonic("old", Chain::Cosmos, kAbandon, "pw", {}));
  EXPECT_OUTCOME_TRUE_1(keystore->rename("old", "new", Chain::Cosmos));
  EXPECT_EC(keystore->show("old", Chain::Cosmos, "pw"),
            KeystoreError::NOT_FOUND);
  EXPECT_OUTCOME_TRUE(shown, keystore->show("new", Chain::Cosmos, "pw"));
  EXPECT_EQ(shown.address, info.address);

  EXPECT_OUTCOME_TRUE_1(keystore->remove("new", Chain::Cosmos));
  EXPECT_EC(keystore->show("new", Chain::Cosmos, "pw"),
            KeystoreError::NOT_FOUND);
  EXPECT_EC(keystore->remove("new", Chain::Cosmos), KeystoreError::NOT_FOUND);
  EXPECT_TRUE(listDirectory().empty());
}

/**
 * @given key file whose address was altered
 * @when key shown
 * @then mismatch with the decrypted key is reported as CORRUPT_RECORD
 */
TEST_F(KeystoreTest, TamperedAddress) {
  EXPECT_OUTCOME_TRUE_1(
      keystore->importMnemonic("dev", Chain::Ethereum, kTestJunk, "pw", {}));
  auto content = readKeyFile("dev.eth.json");
  boost::algorithm::replace_all(content,
                                "0xf39Fd6e51aad88F6F4ce6aB8827279cffFb92266",
                                "0x70997970C51812dc3A010C7d01b50e0d17dc79C8");
  writeKeyFile("dev.eth.json", content);

  EXPECT_OUTCOME_TRUE(listed, keystore->list(Chain::Ethereum));
  ASSERT_EQ(listed.records.size(), 1);
  EXPECT_EQ(listed.records[0].address,
            "0x70997970C51812dc3A010C7d01b50e0d17dc79C8");
  EXPECT_EC(keystore->show("dev", Chain::Ethereum, "pw"),
            KeystoreError::CORRUPT_RECORD);
}

/**
 * @given Ethereum key file copied over to the Cosmos extension with its
 * chain field rewritten
 * @when shown as a Cosmos key
 * @then encryption bound to the chain name refuses to decrypt it
 */
TEST_F(KeystoreTest, SecretBoundToChain) {
  EXPECT_OUTCOME_TRUE_1(
      keystore->importMnemonic("dev", Chain::Ethereum, kTestJunk, "pw", {}));
  EXPECT_OUTCOME_TRUE_1(
      keystore->importMnemonic("relay", Chain::Cosmos, kTestJunk, "pw", {}));

  auto eth_content = readKeyFile("dev.eth.json");
  auto cosmos_content = readKeyFile("relay.cosmos.json");
  auto crypto_pos = eth_content.find("\"crypto\"");
  auto cosmos_crypto_pos = cosmos_content.find("\"crypto\"");
  ASSERT_NE(crypto_pos, std::string::npos);
  ASSERT_NE(cosmos_crypto_pos, std::string::npos);
  // cosmos metadata followed by the ethereum encrypted secret
  writeKeyFile("relay.cosmos.json",
               cosmos_content.substr(0, cosmos_crypto_pos)
                   + eth_content.substr(crypto_pos));

  EXPECT_EC(keystore->show("relay", Chain::Cosmos, "pw"),
            KeystoreError::DECRYPTION_FAILED);
}
