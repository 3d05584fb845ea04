/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <soralog/impl/configurator_from_yaml.hpp>

#include "filesystem/common.hpp"

namespace gorc::log {

  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    /// Uses the embedded config
    Configurator();

    explicit Configurator(std::string config);

    explicit Configurator(filesystem::path path);

    /// Extracts `--logcfg` value from command line, ignoring other options
    static std::optional<filesystem::path> getLogConfigFile(int argc,
                                                            const char **argv);
  };

}  // namespace gorc::log
