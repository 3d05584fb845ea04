/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdio>
#include <iostream>

#include <soralog/logging_system.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "application/impl/keys_application_impl.hpp"
#include "application/impl/terminal_prompt.hpp"
#include "injector/keystore_injector.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

using gorc::application::AppConfigurationError;
using gorc::application::AppConfigurationImpl;

namespace {
  constexpr int kExitUsage = 2;

  int run_command(int argc, const char **argv) {
    auto configuration = std::make_shared<AppConfigurationImpl>(
        gorc::log::createLogger("AppConfiguration", "application"));

    auto parsed = configuration->initializeFromArgs(argc, argv);
    if (parsed.has_error()) {
      if (parsed.error() == AppConfigurationError::HELP_REQUESTED) {
        return EXIT_SUCCESS;
      }
      // usage errors are already explained by the parser
      if (parsed.error() == AppConfigurationError::USAGE_ERROR) {
        return kExitUsage;
      }
      std::cerr << "Error: " << parsed.error().message() << '\n';
      return EXIT_FAILURE;
    }

    auto tuned = gorc::log::tuneLoggingSystem(configuration->log());
    if (tuned.has_error()) {
      std::cerr << "Error: " << tuned.error().message() << '\n';
      return kExitUsage;
    }

    gorc::injector::KeystoreInjector injector{configuration};
    auto keystore = injector.injectKeystore();
    if (keystore.has_error()) {
      std::cerr << "Error: " << keystore.error().message() << '\n';
      return EXIT_FAILURE;
    }

    auto prompt = std::make_shared<gorc::application::TerminalPrompt>(
        std::cin, std::cerr);

    gorc::application::KeysApplicationImpl app{configuration,
                                               std::move(keystore.value()),
                                               std::move(prompt),
                                               std::cout,
                                               std::cerr};
    return app.run();
  }
}  // namespace

int main(int argc, const char **argv) {
  setvbuf(stderr, nullptr, _IOLBF, 0);

  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        gorc::log::Configurator::getLogConfigFile(argc - 1, argv + 1);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto gorc_log_configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<gorc::log::Configurator>(
                  custom_log_config_path.value())
            : std::make_shared<gorc::log::Configurator>();

    return std::make_shared<soralog::LoggingSystem>(
        std::move(gorc_log_configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  gorc::log::setLoggingSystem(logging_system);

  int exit_code = run_command(argc, argv);

  auto logger = gorc::log::createLogger("Main", gorc::log::defaultGroupName);
  logger->flush();

  std::cout.flush();
  std::cerr.flush();
  return exit_code;
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
