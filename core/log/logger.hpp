/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <qtils/strict_sptr.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "outcome/outcome.hpp"

// pre-include all formatters
#include "log/formatters/filepath.hpp"

namespace gorc::log {

  using Level = soralog::Level;
  using Logger = qtils::StrictSharedPtr<soralog::Logger>;

  enum class Error : uint8_t { WRONG_LEVEL = 1, WRONG_GROUP };

  outcome::result<Level> str2lvl(std::string_view str);

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system);

  /**
   * Applies `--log` values: a bare level tunes the root group, `group=level`
   * tunes one group
   * @return error for the first chunk that can't be applied
   */
  outcome::result<void> tuneLoggingSystem(const std::vector<std::string> &cfg);

  static const std::string defaultGroupName("gorc");

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group);
  /// used by tests to quieten or raise every keystore group at once
  bool setLevelOfGroup(const std::string &group_name, Level level);

}  // namespace gorc::log

OUTCOME_HPP_DECLARE_ERROR(gorc::log, Error);
