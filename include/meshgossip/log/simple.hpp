/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>
#include <string>

#include <fmt/format.h>
#include <meshgossip/log/logger.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>

namespace meshgossip {
  /**
   * Console logging for examples and tools.
   * @param level soralog level name for the "main" group, e.g. "debug".
   */
  inline void simpleLoggingSystem(const std::string &level = "info") {
    auto yaml = fmt::format(R"(
    sinks:
      - name: console
        type: console
        color: true
        capacity: 4
        latency: 0
    groups:
      - name: main
        sink: console
        level: {}
        is_fallback: true
        children:
          - name: meshgossip
    )",
                            level);
    auto logsys = std::make_shared<soralog::LoggingSystem>(
        std::make_shared<soralog::ConfiguratorFromYAML>(yaml));
    auto r = logsys->configure();
    if (not r.message.empty()) {
      fmt::print(stderr, "soralog error: {}\n", r.message);
    }
    if (r.has_error) {
      exit(EXIT_FAILURE);
    }
    log::setLoggingSystem(logsys);
  }
}  // namespace meshgossip
