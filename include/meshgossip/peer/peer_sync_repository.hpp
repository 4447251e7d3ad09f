/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include <meshgossip/common/types.hpp>

namespace meshgossip::peer {
  struct PeerSyncStatus {
    PeerId peer_id;
    /// Last time a gossip message from this peer was processed.
    TimestampMs last_sync_time = 0;
    /// Gossip messages processed from this peer.
    size_t message_count = 0;
    bool is_connected = true;

    bool operator==(const PeerSyncStatus &) const = default;
  };

  /**
   * Per-peer sync bookkeeping. Entries are never deleted, a lost peer is
   * only marked disconnected.
   */
  class PeerSyncRepository {
   public:
    virtual ~PeerSyncRepository() = default;

    /**
     * Account one processed message from `peer`, creating its entry on
     * first contact. The peer is considered connected afterwards.
     */
    virtual void recordMessage(const PeerId &peer, TimestampMs now) = 0;

    /**
     * Update connectivity, creating the entry if needed.
     * @return previous connectivity, `std::nullopt` for an unknown peer.
     */
    virtual std::optional<bool> setConnected(const PeerId &peer,
                                             bool connected) = 0;

    virtual std::optional<PeerSyncStatus> get(const PeerId &peer) const = 0;

    virtual std::vector<PeerSyncStatus> getAll() const = 0;

    virtual size_t size() const = 0;
  };
}  // namespace meshgossip::peer
