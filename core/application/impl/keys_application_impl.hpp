/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/keys_application.hpp"

#include <iosfwd>
#include <memory>

#include "application/app_configuration.hpp"
#include "application/prompt.hpp"
#include "keystore/keystore.hpp"
#include "log/logger.hpp"

namespace gorc::application {

  enum class KeysApplicationError {
    PASSPHRASE_MISMATCH = 1,
    EMPTY_PASSPHRASE,
  };

  class KeysApplicationImpl final : public KeysApplication {
   public:
    static constexpr int kExitSuccess = 0;
    static constexpr int kExitFailure = 1;

    KeysApplicationImpl(std::shared_ptr<AppConfiguration> app_config,
                        std::shared_ptr<keystore::Keystore> keystore,
                        std::shared_ptr<Prompt> prompt,
                        std::ostream &out,
                        std::ostream &err);

    int run() override;

   private:
    outcome::result<void> execute();

    outcome::result<void> add();
    outcome::result<void> importMnemonic();
    outcome::result<void> remove();
    outcome::result<void> rename();
    outcome::result<void> list();
    outcome::result<void> show();

    /// asks for a passphrase, twice when \param confirm is set
    outcome::result<crypto::SecureString> readPassphrase(bool confirm);

    void printKey(const keystore::KeyInfo &info);

    std::shared_ptr<AppConfiguration> app_config_;
    std::shared_ptr<keystore::Keystore> keystore_;
    std::shared_ptr<Prompt> prompt_;
    std::ostream &out_;
    std::ostream &err_;

    log::Logger logger_;
  };

}  // namespace gorc::application

OUTCOME_HPP_DECLARE_ERROR(gorc::application, KeysApplicationError);
