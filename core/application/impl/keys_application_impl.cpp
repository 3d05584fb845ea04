/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/keys_application_impl.hpp"

#include <boost/assert.hpp>
#include <boost/config.hpp>

#include <ostream>

#include "common/hexutil.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(gorc::application, KeysApplicationError, e) {
  using E = gorc::application::KeysApplicationError;
  switch (e) {
    case E::PASSPHRASE_MISMATCH:
      return "passphrases do not match";
    case E::EMPTY_PASSPHRASE:
      return "passphrase must not be empty";
  }
  return "unknown KeysApplicationError";
}

namespace gorc::application {

  KeysApplicationImpl::KeysApplicationImpl(
      std::shared_ptr<AppConfiguration> app_config,
      std::shared_ptr<keystore::Keystore> keystore,
      std::shared_ptr<Prompt> prompt,
      std::ostream &out,
      std::ostream &err)
      : app_config_{std::move(app_config)},
        keystore_{std::move(keystore)},
        prompt_{std::move(prompt)},
        out_{out},
        err_{err},
        logger_{log::createLogger("KeysApplication", "application")} {
    BOOST_ASSERT(app_config_ != nullptr);
    BOOST_ASSERT(keystore_ != nullptr);
    BOOST_ASSERT(prompt_ != nullptr);
  }

  int KeysApplicationImpl::run() {
    auto res = execute();
    out_.flush();
    if (res.has_error()) {
      SL_DEBUG(logger_, "Command failed: {}", res.error().message());
      err_ << "Error: " << res.error().message() << std::endl;
      return kExitFailure;
    }
    return kExitSuccess;
  }

  outcome::result<void> KeysApplicationImpl::execute() {
    switch (app_config_->command().action) {
      case KeysAction::Add:
        return add();
      case KeysAction::Import:
        return importMnemonic();
      case KeysAction::Delete:
        return remove();
      case KeysAction::Rename:
        return rename();
      case KeysAction::List:
        return list();
      case KeysAction::Show:
        return show();
    }
    BOOST_UNREACHABLE_RETURN({});
  }

  outcome::result<void> KeysApplicationImpl::add() {
    const auto &cmd = app_config_->command();
    OUTCOME_TRY(passphrase, readPassphrase(true));

    if (not cmd.with_mnemonic) {
      OUTCOME_TRY(info, keystore_->add(cmd.names[0], cmd.chain, passphrase));
      printKey(info);
      return outcome::success();
    }

    OUTCOME_TRY(generated,
                keystore_->addWithMnemonic(
                    cmd.names[0], cmd.chain, passphrase, cmd.words));
    printKey(generated.info);
    err_ << "Write down the mnemonic below, it is the only way to recover "
            "the key:"
         << std::endl;
    out_ << generated.mnemonic << std::endl;
    return outcome::success();
  }

  outcome::result<void> KeysApplicationImpl::importMnemonic() {
    const auto &cmd = app_config_->command();
    OUTCOME_TRY(mnemonic, prompt_->readSecret("Enter mnemonic: "));

    keystore::DerivationOptions options;
    options.account_index = cmd.account;
    options.hd_path = cmd.hd_path;
    if (cmd.ask_bip39_password) {
      OUTCOME_TRY(password, prompt_->readSecret("Enter BIP-39 password: "));
      options.bip39_password = std::move(password);
    }

    OUTCOME_TRY(passphrase, readPassphrase(true));
    OUTCOME_TRY(info,
                keystore_->importMnemonic(
                    cmd.names[0], cmd.chain, mnemonic, passphrase, options));
    printKey(info);
    return outcome::success();
  }

  outcome::result<void> KeysApplicationImpl::remove() {
    const auto &cmd = app_config_->command();
    OUTCOME_TRY(keystore_->remove(cmd.names[0], cmd.chain));
    SL_INFO(logger_, "Deleted {} key '{}'", cmd.chain, cmd.names[0]);
    return outcome::success();
  }

  outcome::result<void> KeysApplicationImpl::rename() {
    const auto &cmd = app_config_->command();
    OUTCOME_TRY(keystore_->rename(cmd.names[0], cmd.names[1], cmd.chain));
    SL_INFO(logger_,
            "Renamed {} key '{}' to '{}'",
            cmd.chain,
            cmd.names[0],
            cmd.names[1]);
    return outcome::success();
  }

  outcome::result<void> KeysApplicationImpl::list() {
    OUTCOME_TRY(listed, keystore_->list(app_config_->command().chain));
    for (const auto &record : listed.records) {
      out_ << record.name << '\t' << record.address << '\n';
    }
    for (const auto &skipped : listed.skipped) {
      err_ << "Skipped " << skipped.file_name << ": "
           << skipped.error.message() << '\n';
    }
    return outcome::success();
  }

  outcome::result<void> KeysApplicationImpl::show() {
    const auto &cmd = app_config_->command();
    OUTCOME_TRY(passphrase, readPassphrase(false));
    OUTCOME_TRY(info, keystore_->show(cmd.names[0], cmd.chain, passphrase));
    out_ << info.name << '\t' << info.address << '\t'
         << common::hex_lower_0x(info.public_key) << '\t'
         << info.derivation_path.value_or("-") << '\n';
    return outcome::success();
  }

  outcome::result<crypto::SecureString> KeysApplicationImpl::readPassphrase(
      bool confirm) {
    OUTCOME_TRY(passphrase, prompt_->readSecret("Enter passphrase: "));
    if (passphrase.empty()) {
      return KeysApplicationError::EMPTY_PASSPHRASE;
    }
    if (confirm) {
      OUTCOME_TRY(repeated, prompt_->readSecret("Repeat passphrase: "));
      if (repeated != passphrase) {
        return KeysApplicationError::PASSPHRASE_MISMATCH;
      }
    }
    return passphrase;
  }

  void KeysApplicationImpl::printKey(const keystore::KeyInfo &info) {
    out_ << info.name << '\t' << info.address << '\n';
  }

}  // namespace gorc::application
