/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <meshgossip/common/types.hpp>
#include <meshgossip/framing/message_chunk.hpp>
#include <meshgossip/log/logger.hpp>

namespace meshgossip::framing {
  struct ReassemblerConfig {
    /**
     * Partial messages older than this (since their first chunk) are evicted.
     */
    std::chrono::milliseconds timeout{30000};
    /**
     * Period of the eviction sweep.
     */
    std::chrono::milliseconds sweep_interval{10000};
  };

  /**
   * Collects chunks of many concurrent messages until each is complete.
   *
   * Chunks are grouped by messageId and keyed by index, so duplicates are
   * absorbed. A periodic sweep drops groups that never complete.
   * Not thread safe: use from the io_context thread only.
   */
  class ChunkReassembler
      : public std::enable_shared_from_this<ChunkReassembler> {
   public:
    using Clock = SteadyClock;

    ChunkReassembler(std::shared_ptr<boost::asio::io_context> io_context,
                     ReassemblerConfig config);

    /// Start the periodic sweep.
    void start();

    /// Cancel the sweep and forget all partial messages.
    void stop();

    /**
     * Add one chunk.
     * @return the full message when this chunk completes it, `std::nullopt`
     * while still waiting. Errors:
     * - `MALFORMED_CHUNK` if the index is outside `0..totalChunks-1`.
     * - `TOTAL_CHUNKS_MISMATCH` if the chunk disagrees with its group; the
     *   chunk is dropped, the group kept.
     * - any `reassemble` error once the group is complete; the group is
     *   discarded.
     */
    outcome::result<std::optional<std::string>> addChunk(
        MessageChunk chunk, Clock::time_point now = Clock::now());

    /**
     * Evict groups whose first chunk arrived more than `timeout` ago.
     * @return number of evicted groups.
     */
    size_t sweep(Clock::time_point now = Clock::now());

    /// Number of messages with some, but not all, chunks received.
    size_t partialCount() const;

    void clear();

   private:
    struct Partial {
      std::map<uint32_t, MessageChunk> chunks;
      uint32_t total_chunks = 0;
      Clock::time_point first_seen;
    };

    std::shared_ptr<boost::asio::io_context> io_context_;
    ReassemblerConfig config_;
    std::unordered_map<std::string, Partial> partial_;
    std::shared_ptr<boost::asio::steady_timer> sweep_timer_;
    log::Logger log_;
  };
}  // namespace meshgossip::framing
