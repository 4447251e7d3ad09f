/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <meshgossip/peer/peer_sync_repository.hpp>

#include <unordered_map>

namespace meshgossip::peer {

  class InmemPeerSyncRepository : public PeerSyncRepository {
   public:
    void recordMessage(const PeerId &peer, TimestampMs now) override;

    std::optional<bool> setConnected(const PeerId &peer,
                                     bool connected) override;

    std::optional<PeerSyncStatus> get(const PeerId &peer) const override;

    std::vector<PeerSyncStatus> getAll() const override;

    size_t size() const override;

   private:
    std::unordered_map<PeerId, PeerSyncStatus> peers_;
  };

}  // namespace meshgossip::peer
