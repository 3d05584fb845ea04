/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "application/app_configuration.hpp"

namespace gorc::application {

  class AppConfigurationMock : public AppConfiguration {
   public:
    MOCK_METHOD(const filesystem::path &,
                keystorePath,
                (),
                (const, override));

    MOCK_METHOD(const std::string &, cosmosPrefix, (), (const, override));

    MOCK_METHOD(const crypto::ScryptParams &,
                scryptParams,
                (),
                (const, override));

    MOCK_METHOD(const std::vector<std::string> &, log, (), (const, override));

    MOCK_METHOD(const KeysCommand &, command, (), (const, override));
  };

}  // namespace gorc::application
