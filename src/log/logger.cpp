/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <meshgossip/log/logger.hpp>

#include <fmt/format.h>
#include <mutex>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace meshgossip::log {
  namespace {
    // Console sink, info level, every meshgossip logger falls back to "main".
    constexpr auto kDefaultConfig = R"(
    sinks:
      - name: console
        type: console
        color: false
        capacity: 4
        latency: 0
    groups:
      - name: main
        sink: console
        level: info
        is_fallback: true
        children:
          - name: meshgossip
    )";

    std::mutex &systemMutex() {
      static std::mutex mutex;
      return mutex;
    }

    std::shared_ptr<soralog::LoggingSystem> &system() {
      static std::shared_ptr<soralog::LoggingSystem> logging_system;
      return logging_system;
    }

    std::shared_ptr<soralog::LoggingSystem> ensureSystem() {
      std::lock_guard lock{systemMutex()};
      auto &logging_system = system();
      if (logging_system == nullptr) {
        logging_system = std::make_shared<soralog::LoggingSystem>(
            std::make_shared<soralog::ConfiguratorFromYAML>(
                std::string{kDefaultConfig}));
        auto r = logging_system->configure();
        if (not r.message.empty()) {
          fmt::print(stderr, "soralog error: {}\n", r.message);
        }
      }
      return logging_system;
    }
  }  // namespace

  void setLoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system) {
    std::lock_guard lock{systemMutex()};
    system() = std::move(logging_system);
  }

  void setLevelOfGroup(const std::string &group_name, Level level) {
    ensureSystem()->setLevelOfGroup(group_name, level);
  }

  Logger createLogger(const std::string &tag) {
    return createLogger(tag, kDefaultGroupName);
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return ensureSystem()->getLogger(tag, group);
  }
}  // namespace meshgossip::log
