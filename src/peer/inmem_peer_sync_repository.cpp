/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <meshgossip/peer/inmem_peer_sync_repository.hpp>

#include <algorithm>

namespace meshgossip::peer {

  void InmemPeerSyncRepository::recordMessage(const PeerId &peer,
                                              TimestampMs now) {
    auto it = peers_.find(peer);
    if (it == peers_.end()) {
      it = peers_.emplace(peer, PeerSyncStatus{.peer_id = peer}).first;
    }
    auto &status = it->second;
    status.last_sync_time = now;
    ++status.message_count;
    status.is_connected = true;
  }

  std::optional<bool> InmemPeerSyncRepository::setConnected(const PeerId &peer,
                                                            bool connected) {
    auto it = peers_.find(peer);
    if (it == peers_.end()) {
      peers_.emplace(peer,
                     PeerSyncStatus{.peer_id = peer, .is_connected = connected});
      return std::nullopt;
    }
    auto previous = it->second.is_connected;
    it->second.is_connected = connected;
    return previous;
  }

  std::optional<PeerSyncStatus> InmemPeerSyncRepository::get(
      const PeerId &peer) const {
    auto it = peers_.find(peer);
    if (it != peers_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  std::vector<PeerSyncStatus> InmemPeerSyncRepository::getAll() const {
    std::vector<PeerSyncStatus> result;
    result.reserve(peers_.size());
    for (auto &entry : peers_) {
      result.emplace_back(entry.second);
    }
    std::ranges::sort(result, {}, &PeerSyncStatus::peer_id);
    return result;
  }

  size_t InmemPeerSyncRepository::size() const {
    return peers_.size();
  }

}  // namespace meshgossip::peer
