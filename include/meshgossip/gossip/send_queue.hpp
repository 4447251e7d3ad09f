/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <vector>

#include <meshgossip/gossip/message.hpp>

namespace meshgossip::gossip {
  struct QueueEntry {
    GossipMessage message;
    MessagePriority priority = MessagePriority::Have;
    /// Failed send attempts so far.
    size_t retry_count = 0;
    /// Unicast destination; broadcast when empty.
    std::optional<PeerId> target;
  };

  /**
   * Priority queue of outbound messages.
   * Lowest priority number first, insertion order among equals.
   */
  class SendQueue {
   public:
    void push(QueueEntry entry);

    std::optional<QueueEntry> pop();

    [[nodiscard]] size_t size() const;

    [[nodiscard]] bool empty() const;

    /// Copy of pending entries in the order they will be sent.
    std::vector<QueueEntry> snapshot() const;

   private:
    using Key = std::pair<MessagePriority, uint64_t>;

    std::map<Key, QueueEntry> entries_;
    uint64_t next_seq_ = 0;
  };
}  // namespace meshgossip::gossip
