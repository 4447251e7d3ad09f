/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <meshgossip/codec/codec.hpp>
#include <meshgossip/framing/chunk_reassembler.hpp>
#include <meshgossip/gossip/survival_post.hpp>

namespace meshgossip::gossip {
  using namespace std::chrono_literals;

  enum class ConfigError {
    INVALID_VALUE,
  };

  Q_ENUM_ERROR_CODE(ConfigError) {
    using E = decltype(e);
    switch (e) {
      case E::INVALID_VALUE:
        return "Invalid configuration value";
    }
    abort();
  }

  struct Config {
    /// Messages with this many hops or more are dropped on receipt.
    uint32_t max_hops = 5;

    /**
     * Delay before each retry of a failed send. A message is dropped once
     * it failed `retry_backoff.size() + 1` times.
     */
    std::vector<std::chrono::milliseconds> retry_backoff{1s, 2s, 4s, 8s};

    /// Hard limit of one radio payload. Must exceed the chunk framing overhead.
    size_t max_payload_bytes = 512;

    /**
     * Largest whole message, before chunking and after decompression.
     * Bigger inbound messages are dropped, bigger outbound ones never framed.
     */
    size_t max_message_bytes = codec::kMaxInflatedBytes;

    framing::ReassemblerConfig reassembly;

    /// Pause after every send attempt, so the radio and inbound events keep up.
    std::chrono::milliseconds inter_send_delay{100};

    /// Seen identities kept before the set is cleared wholesale.
    size_t seen_cache_limit = 1000;

    PostLimits post_limits;

    /// Acknowledge merged posts back to the peer that delivered them.
    bool send_acks = false;

    /// Name advertised to nearby devices.
    std::string advertise_name = "NeighborYield";

    /// This node's sender id; generated at engine construction if empty.
    std::string device_id;
  };

  /**
   * Apply MESHGOSSIP_* environment overrides on top of `config`.
   * Returns `INVALID_VALUE` if a variable is set but unparsable, or if the
   * resulting payload limit cannot carry a chunk.
   */
  outcome::result<Config> configFromEnv(Config config = {});
}  // namespace meshgossip::gossip
