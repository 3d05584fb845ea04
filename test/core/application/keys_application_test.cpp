/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/keys_application_impl.hpp"

#include <sstream>

#include <gtest/gtest.h>

#include "keystore/keystore_error.hpp"
#include "mock/core/application/app_configuration_mock.hpp"
#include "mock/core/application/prompt_mock.hpp"
#include "mock/core/keystore/keystore_mock.hpp"
#include "testutil/literals.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace gorc::application;
using gorc::crypto::SecureString;
using gorc::keystore::Chain;
using gorc::keystore::DerivationOptions;
using gorc::keystore::KeyInfo;
using gorc::keystore::KeystoreError;
using gorc::keystore::KeystoreMock;
using gorc::keystore::ListResult;
using gorc::keystore::MnemonicKeyInfo;
using testing::_;
using testing::AllOf;
using testing::Eq;
using testing::Field;
using testing::InSequence;
using testing::Return;
using testing::ReturnRef;

namespace {
  outcome::result<SecureString> secret(const char *value) {
    return SecureString{value};
  }

  std::string message(std::error_code ec) {
    return ec.message();
  }
}  // namespace

class KeysApplicationTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    app_config = std::make_shared<AppConfigurationMock>();
    keystore = std::make_shared<KeystoreMock>();
    prompt = std::make_shared<PromptMock>();
    ON_CALL(*app_config, command()).WillByDefault(ReturnRef(command));
    EXPECT_CALL(*app_config, command()).Times(testing::AnyNumber());

    info = KeyInfo{
        .name = "val",
        .chain = Chain::Cosmos,
        .public_key = "02aabb"_unhex,
        .address = "cosmos1abc",
        .derivation_path = std::nullopt,
    };
  }

  int run() {
    KeysApplicationImpl app{app_config, keystore, prompt, out, err};
    return app.run();
  }

  void expectPassphrase(const char *first, const char *second) {
    EXPECT_CALL(*prompt, readSecret(Eq("Enter passphrase: ")))
        .WillOnce(Return(secret(first)));
    EXPECT_CALL(*prompt, readSecret(Eq("Repeat passphrase: ")))
        .WillOnce(Return(secret(second)));
  }

  KeysCommand command;
  KeyInfo info;
  std::shared_ptr<AppConfigurationMock> app_config;
  std::shared_ptr<KeystoreMock> keystore;
  std::shared_ptr<PromptMock> prompt;
  std::ostringstream out;
  std::ostringstream err;
};

/**
 * @given add command
 * @when run with a confirmed passphrase
 * @then random key is added and its name and address printed
 */
TEST_F(KeysApplicationTest, Add) {
  command = {.chain = Chain::Cosmos,
             .action = KeysAction::Add,
             .names = {"val"}};
  expectPassphrase("secret", "secret");
  EXPECT_CALL(*keystore, add(Eq("val"), Chain::Cosmos, Eq("secret")))
      .WillOnce(Return(info));

  EXPECT_EQ(run(), KeysApplicationImpl::kExitSuccess);
  EXPECT_EQ(out.str(), "val\tcosmos1abc\n");
  EXPECT_EQ(err.str(), "");
}

/**
 * @given add command with mnemonic generation
 * @when run
 * @then mnemonic is printed after the key, with a warning on stderr
 */
TEST_F(KeysApplicationTest, AddWithMnemonic) {
  command = {.chain = Chain::Ethereum,
             .action = KeysAction::Add,
             .names = {"val"},
             .with_mnemonic = true,
             .words = 12};
  expectPassphrase("secret", "secret");
  MnemonicKeyInfo generated{.info = info, .mnemonic = "word1 word2"};
  EXPECT_CALL(*keystore,
              addWithMnemonic(Eq("val"), Chain::Ethereum, Eq("secret"), 12))
      .WillOnce(Return(generated));

  EXPECT_EQ(run(), KeysApplicationImpl::kExitSuccess);
  EXPECT_EQ(out.str(), "val\tcosmos1abc\nword1 word2\n");
  EXPECT_NE(err.str().find("Write down the mnemonic"), std::string::npos);
}

/**
 * @given add command
 * @when passphrase confirmation differs or passphrase is empty
 * @then nothing is stored and the error is reported
 */
TEST_F(KeysApplicationTest, PassphraseChecks) {
  command = {.chain = Chain::Cosmos,
             .action = KeysAction::Add,
             .names = {"val"}};
  EXPECT_CALL(*keystore, add(_, _, _)).Times(0);

  expectPassphrase("secret", "secreT");
  EXPECT_EQ(run(), KeysApplicationImpl::kExitFailure);
  EXPECT_EQ(err.str(),
            "Error: "
                + message(KeysApplicationError::PASSPHRASE_MISMATCH) + "\n");

  err.str("");
  EXPECT_CALL(*prompt, readSecret(Eq("Enter passphrase: ")))
      .WillOnce(Return(secret("")));
  EXPECT_EQ(run(), KeysApplicationImpl::kExitFailure);
  EXPECT_EQ(err.str(),
            "Error: " + message(KeysApplicationError::EMPTY_PASSPHRASE)
                + "\n");
  EXPECT_EQ(out.str(), "");
}

/**
 * @given import command with account and BIP-0039 password
 * @when run
 * @then mnemonic, password and passphrase are prompted in order and passed
 * to the keystore
 */
TEST_F(KeysApplicationTest, Import) {
  command = {.chain = Chain::Cosmos,
             .action = KeysAction::Import,
             .names = {"orch"},
             .account = 2,
             .ask_bip39_password = true};
  {
    InSequence seq;
    EXPECT_CALL(*prompt, readSecret(Eq("Enter mnemonic: ")))
        .WillOnce(Return(secret("test test junk")));
    EXPECT_CALL(*prompt, readSecret(Eq("Enter BIP-39 password: ")))
        .WillOnce(Return(secret("TREZOR")));
    EXPECT_CALL(*prompt, readSecret(Eq("Enter passphrase: ")))
        .WillOnce(Return(secret("secret")));
    EXPECT_CALL(*prompt, readSecret(Eq("Repeat passphrase: ")))
        .WillOnce(Return(secret("secret")));
  }
  info.name = "orch";
  info.derivation_path = "m/44'/118'/2'/0/0";
  EXPECT_CALL(
      *keystore,
      importMnemonic(
          Eq("orch"),
          Chain::Cosmos,
          Eq("test test junk"),
          Eq("secret"),
          AllOf(
              Field(&DerivationOptions::account_index, 2),
              Field(&DerivationOptions::bip39_password, SecureString{"TREZOR"}),
              Field(&DerivationOptions::hd_path, std::nullopt))))
      .WillOnce(Return(info));

  EXPECT_EQ(run(), KeysApplicationImpl::kExitSuccess);
  EXPECT_EQ(out.str(), "orch\tcosmos1abc\n");
}

/**
 * @given import command
 * @when input is closed before the mnemonic is entered
 * @then command fails without touching the keystore
 */
TEST_F(KeysApplicationTest, ImportInputClosed) {
  command = {.chain = Chain::Ethereum,
             .action = KeysAction::Import,
             .names = {"orch"}};
  EXPECT_CALL(*prompt, readSecret(Eq("Enter mnemonic: ")))
      .WillOnce(Return(outcome::failure(PromptError::INPUT_CLOSED)));
  EXPECT_CALL(*keystore, importMnemonic(_, _, _, _, _)).Times(0);
  EXPECT_EQ(run(), KeysApplicationImpl::kExitFailure);
  EXPECT_EQ(err.str(),
            "Error: " + message(PromptError::INPUT_CLOSED) + "\n");
}

/**
 * @given delete and rename commands
 * @when run
 * @then keystore is asked without any prompts and errors are reported
 */
TEST_F(KeysApplicationTest, DeleteAndRename) {
  EXPECT_CALL(*prompt, readSecret(_)).Times(0);

  command = {.chain = Chain::Cosmos,
             .action = KeysAction::Delete,
             .names = {"val"}};
  EXPECT_CALL(*keystore, remove(Eq("val"), Chain::Cosmos))
      .WillOnce(Return(outcome::success()))
      .WillOnce(Return(outcome::failure(KeystoreError::NOT_FOUND)));
  EXPECT_EQ(run(), KeysApplicationImpl::kExitSuccess);
  EXPECT_EQ(run(), KeysApplicationImpl::kExitFailure);
  EXPECT_EQ(err.str(), "Error: " + message(KeystoreError::NOT_FOUND) + "\n");

  err.str("");
  command = {.chain = Chain::Ethereum,
             .action = KeysAction::Rename,
             .names = {"old", "new"}};
  EXPECT_CALL(*keystore, rename(Eq("old"), Eq("new"), Chain::Ethereum))
      .WillOnce(Return(outcome::success()));
  EXPECT_EQ(run(), KeysApplicationImpl::kExitSuccess);
  EXPECT_EQ(err.str(), "");
  EXPECT_EQ(out.str(), "");
}

/**
 * @given keystore with two readable records and a corrupt file
 * @when list run
 * @then records go to stdout, skipped file to stderr, command succeeds
 */
TEST_F(KeysApplicationTest, List) {
  command = {.chain = Chain::Cosmos, .action = KeysAction::List};
  ListResult listed;
  listed.records = {{.name = "a", .chain = Chain::Cosmos, .address = "addr1"},
                    {.name = "b", .chain = Chain::Cosmos, .address = "addr2"}};
  listed.skipped = {{.file_name = "c.cosmos.json",
                     .error = make_error_code(KeystoreError::CORRUPT_RECORD)}};
  EXPECT_CALL(*keystore, list(Chain::Cosmos)).WillOnce(Return(listed));

  EXPECT_EQ(run(), KeysApplicationImpl::kExitSuccess);
  EXPECT_EQ(out.str(), "a\taddr1\nb\taddr2\n");
  EXPECT_EQ(err.str(),
            "Skipped c.cosmos.json: "
                + message(KeystoreError::CORRUPT_RECORD) + "\n");
}

/**
 * @given show command
 * @when run with the passphrase asked once
 * @then name, address, public key and derivation path are printed
 */
TEST_F(KeysApplicationTest, Show) {
  command = {.chain = Chain::Cosmos,
             .action = KeysAction::Show,
             .names = {"val"}};
  EXPECT_CALL(*prompt, readSecret(Eq("Enter passphrase: ")))
      .WillOnce(Return(secret("secret")))
      .WillOnce(Return(secret("wrong")));
  EXPECT_CALL(*prompt, readSecret(Eq("Repeat passphrase: "))).Times(0);
  EXPECT_CALL(*keystore, show(Eq("val"), Chain::Cosmos, Eq("secret")))
      .WillOnce(Return(info));
  EXPECT_CALL(*keystore, show(Eq("val"), Chain::Cosmos, Eq("wrong")))
      .WillOnce(Return(outcome::failure(KeystoreError::DECRYPTION_FAILED)));

  EXPECT_EQ(run(), KeysApplicationImpl::kExitSuccess);
  EXPECT_EQ(out.str(), "val\tcosmos1abc\t0x02aabb\t-\n");

  EXPECT_EQ(run(), KeysApplicationImpl::kExitFailure);
  EXPECT_EQ(err.str(),
            "Error: " + message(KeystoreError::DECRYPTION_FAILED) + "\n");
}
