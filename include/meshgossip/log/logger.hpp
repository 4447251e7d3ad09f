/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

namespace meshgossip::log {
  using Level = soralog::Level;
  using Logger = std::shared_ptr<soralog::Logger>;

  /// Group every component logger belongs to unless told otherwise.
  inline const std::string kDefaultGroupName{"meshgossip"};

  /**
   * Install the logging system used by `createLogger`.
   * Must be called before the first logger is created to take effect for it;
   * otherwise a console system at info level is installed lazily.
   */
  void setLoggingSystem(std::shared_ptr<soralog::LoggingSystem> logging_system);

  /// Change verbosity of a whole group (e.g. in tests).
  void setLevelOfGroup(const std::string &group_name, Level level);

  Logger createLogger(const std::string &tag);

  Logger createLogger(const std::string &tag, const std::string &group);
}  // namespace meshgossip::log
