/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <boost/property_tree/ptree_fwd.hpp>

#include "log/logger.hpp"

namespace gorc::application {

  enum class AppConfigurationError {
    HELP_REQUESTED = 1,
    USAGE_ERROR,
    INVALID_CONFIG_FILE,
    INVALID_VALUE,
  };

  class AppConfigurationImpl final : public AppConfiguration {
   public:
    static constexpr std::string_view kUsage =
        "Usage: gorc-keys [options] cosmos|eth COMMAND [ARGS]\n"
        "Commands:\n"
        "  add <name> [--mnemonic [--words N]]\n"
        "  import <name> [--account N] [--hd-path P] [--bip39-password]\n"
        "  delete <name>\n"
        "  rename <name> <new-name>\n"
        "  list\n"
        "  show <name>\n";

    explicit AppConfigurationImpl(log::Logger logger);
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    AppConfigurationImpl(AppConfigurationImpl &&) = default;
    AppConfigurationImpl &operator=(AppConfigurationImpl &&) = delete;

    /**
     * @brief parses command line, overlaying the config file it names
     * @return HELP_REQUESTED after printing help, USAGE_ERROR for malformed
     * command line, INVALID_CONFIG_FILE or INVALID_VALUE for bad settings
     */
    outcome::result<void> initializeFromArgs(int argc, const char **argv);

    const filesystem::path &keystorePath() const override {
      return keystore_path_;
    }
    const std::string &cosmosPrefix() const override {
      return cosmos_prefix_;
    }
    const crypto::ScryptParams &scryptParams() const override {
      return scrypt_params_;
    }
    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }
    const KeysCommand &command() const override {
      return command_;
    }

   private:
    outcome::result<void> loadConfigFile(const filesystem::path &path);
    outcome::result<void> parseConfigTree(
        const boost::property_tree::ptree &tree);
    outcome::result<void> parseCommand(
        const std::vector<std::string> &positional);
    bool validateConfig();

    log::Logger logger_;

    filesystem::path keystore_path_;
    std::string cosmos_prefix_;
    crypto::ScryptParams scrypt_params_;
    std::vector<std::string> logger_tuning_config_;
    KeysCommand command_;
  };

}  // namespace gorc::application

OUTCOME_HPP_DECLARE_ERROR(gorc::application, AppConfigurationError);
