/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <unordered_set>

namespace meshgossip::gossip {
  /**
   * Set of message identities already processed.
   *
   * Bounded by size, not time: once it holds `limit` identities it is cleared
   * wholesale before the next insert. A message seen before a clear can be
   * processed again afterwards; hop limits and "only new posts are
   * rebroadcast" keep that from looping.
   */
  class SeenCache {
   public:
    explicit SeenCache(size_t limit) : limit_{limit} {}

    // Insert identity if absent; returns true if inserted, false if duplicate.
    bool insert(const std::string &identity) {
      if (seen_.contains(identity)) {
        return false;
      }
      if (seen_.size() >= limit_) {
        seen_.clear();
      }
      seen_.emplace(identity);
      return true;
    }

    [[nodiscard]] size_t size() const {
      return seen_.size();
    }

   private:
    size_t limit_;
    std::unordered_set<std::string> seen_;
  };
}  // namespace meshgossip::gossip
