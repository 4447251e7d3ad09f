/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <meshgossip/gossip/config.hpp>

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string_view>

#include <meshgossip/framing/chunker.hpp>

namespace meshgossip::gossip {
  namespace {
    std::optional<std::string> getenvOpt(const char *name) {
      if (const char *v = std::getenv(name)) {
        return std::string{v};
      }
      return std::nullopt;
    }

    template <typename T>
    outcome::result<T> parseInt(std::string_view str) {
      T num;
      auto r = std::from_chars(str.data(), str.data() + str.size(), num);
      if (r.ec != std::errc{} or r.ptr != str.data() + str.size()) {
        return ConfigError::INVALID_VALUE;
      }
      return num;
    }

    std::optional<bool> parseBool(std::string_view str) {
      if (str == "true" or str == "1") {
        return true;
      }
      if (str == "false" or str == "0") {
        return false;
      }
      return std::nullopt;
    }

    // Set `out` from an integer variable if present.
    template <typename T>
    outcome::result<void> overrideInt(const char *name, T &out) {
      if (auto value = getenvOpt(name)) {
        auto parsed = parseInt<T>(*value);
        if (not parsed.has_value()) {
          return parsed.error();
        }
        out = parsed.value();
      }
      return outcome::success();
    }

    outcome::result<void> overrideMs(const char *name,
                                     std::chrono::milliseconds &out) {
      int64_t ms = out.count();
      auto r = overrideInt(name, ms);
      if (not r.has_value()) {
        return r.error();
      }
      if (ms < 0) {
        return ConfigError::INVALID_VALUE;
      }
      out = std::chrono::milliseconds{ms};
      return outcome::success();
    }
  }  // namespace

  outcome::result<Config> configFromEnv(Config config) {
    for (auto r : {
             overrideInt("MESHGOSSIP_MAX_HOPS", config.max_hops),
             overrideInt("MESHGOSSIP_MAX_PAYLOAD", config.max_payload_bytes),
             overrideInt("MESHGOSSIP_MAX_MESSAGE_BYTES",
                         config.max_message_bytes),
             overrideMs("MESHGOSSIP_INTER_SEND_DELAY_MS",
                        config.inter_send_delay),
             overrideMs("MESHGOSSIP_REASSEMBLY_TIMEOUT_MS",
                        config.reassembly.timeout),
         }) {
      if (not r.has_value()) {
        return r.error();
      }
    }
    if (auto value = getenvOpt("MESHGOSSIP_SEND_ACKS")) {
      auto flag = parseBool(*value);
      if (not flag.has_value()) {
        return ConfigError::INVALID_VALUE;
      }
      config.send_acks = *flag;
    }
    if (auto value = getenvOpt("MESHGOSSIP_DEVICE_ID")) {
      config.device_id = *value;
    }
    // split() rejects such units, so every multi-chunk message would be lost
    if (config.max_payload_bytes <= framing::kChunkOverheadBytes) {
      return ConfigError::INVALID_VALUE;
    }
    if (config.max_message_bytes < config.max_payload_bytes) {
      return ConfigError::INVALID_VALUE;
    }
    return config;
  }
}  // namespace meshgossip::gossip
