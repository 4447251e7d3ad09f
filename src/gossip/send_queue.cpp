/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <meshgossip/gossip/send_queue.hpp>

namespace meshgossip::gossip {
  void SendQueue::push(QueueEntry entry) {
    Key key{entry.priority, next_seq_++};
    entries_.emplace(key, std::move(entry));
  }

  std::optional<QueueEntry> SendQueue::pop() {
    if (entries_.empty()) {
      return std::nullopt;
    }
    auto node = entries_.extract(entries_.begin());
    return std::move(node.mapped());
  }

  size_t SendQueue::size() const {
    return entries_.size();
  }

  bool SendQueue::empty() const {
    return entries_.empty();
  }

  std::vector<QueueEntry> SendQueue::snapshot() const {
    std::vector<QueueEntry> result;
    result.reserve(entries_.size());
    for (auto &entry : entries_) {
      result.emplace_back(entry.second);
    }
    return result;
  }
}  // namespace meshgossip::gossip
