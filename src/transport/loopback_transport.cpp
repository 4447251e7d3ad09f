/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <meshgossip/transport/loopback_transport.hpp>

#include <boost/asio/post.hpp>
#include <meshgossip/common/weak_macro.hpp>

namespace meshgossip::transport {

  LoopbackHub::LoopbackHub(std::shared_ptr<boost::asio::io_context> io_context,
                           size_t max_payload_bytes)
      : io_context_{std::move(io_context)},
        max_payload_bytes_{max_payload_bytes} {}

  std::shared_ptr<LoopbackTransport> LoopbackHub::createNode(PeerId peer_id) {
    auto node =
        std::make_shared<LoopbackTransport>(shared_from_this(), peer_id);
    nodes_[peer_id] = node;
    return node;
  }

  LoopbackHub::Link LoopbackHub::makeLink(const PeerId &a, const PeerId &b) {
    return a < b ? Link{a, b} : Link{b, a};
  }

  void LoopbackHub::link(const PeerId &a, const PeerId &b) {
    if (a == b or not links_.emplace(makeLink(a, b)).second) {
      return;
    }
    if (active(a) and active(b)) {
      postFound(a, b);
      postFound(b, a);
    }
  }

  void LoopbackHub::unlink(const PeerId &a, const PeerId &b) {
    if (links_.erase(makeLink(a, b)) == 0) {
      return;
    }
    if (active(a) and active(b)) {
      postLost(a, b);
      postLost(b, a);
    }
  }

  bool LoopbackHub::linked(const PeerId &a, const PeerId &b) const {
    return links_.contains(makeLink(a, b));
  }

  std::vector<PeerId> LoopbackHub::connectedPeers(const PeerId &peer_id) const {
    std::vector<PeerId> peers;
    if (not active(peer_id)) {
      return peers;
    }
    for (auto &[a, b] : links_) {
      if (a == peer_id and active(b)) {
        peers.emplace_back(b);
      } else if (b == peer_id and active(a)) {
        peers.emplace_back(a);
      }
    }
    return peers;
  }

  size_t LoopbackHub::maxPayloadBytes() const {
    return max_payload_bytes_;
  }

  std::shared_ptr<LoopbackTransport> LoopbackHub::node(
      const PeerId &peer_id) const {
    auto it = nodes_.find(peer_id);
    if (it == nodes_.end()) {
      return nullptr;
    }
    return it->second.lock();
  }

  bool LoopbackHub::active(const PeerId &peer_id) const {
    auto n = node(peer_id);
    return n and n->started();
  }

  // Called after `peer_id` became started: announce it to started neighbours.
  void LoopbackHub::onStarted(const PeerId &peer_id) {
    for (auto &peer : connectedPeers(peer_id)) {
      postFound(peer_id, peer);
      postFound(peer, peer_id);
    }
  }

  // Called before `peer_id` stops.
  void LoopbackHub::onStopped(const PeerId &peer_id) {
    for (auto &peer : connectedPeers(peer_id)) {
      postLost(peer, peer_id);
    }
  }

  void LoopbackHub::postFound(const PeerId &to, const PeerId &peer) {
    boost::asio::post(*io_context_, [WEAK_SELF, to, peer] {
      WEAK_LOCK(self);
      auto target = self->node(to);
      auto found = self->node(peer);
      if (not target or not found) {
        return;
      }
      target->events().endpoint_found(peer, found->advertisedName());
    });
  }

  void LoopbackHub::postLost(const PeerId &to, const PeerId &peer) {
    boost::asio::post(*io_context_, [WEAK_SELF, to, peer] {
      WEAK_LOCK(self);
      if (auto target = self->node(to)) {
        target->events().endpoint_lost(peer);
      }
    });
  }

  void LoopbackHub::deliver(const PeerId &from,
                            const PeerId &to,
                            std::string payload) {
    boost::asio::post(
        *io_context_,
        [WEAK_SELF, from, to, payload{std::move(payload)}] {
          WEAK_LOCK(self);
          // Link may have gone down while the payload was in the air.
          if (not self->linked(from, to) or not self->active(to)) {
            return;
          }
          self->node(to)->events().payload_received(from, payload);
        });
  }

  LoopbackTransport::LoopbackTransport(std::shared_ptr<LoopbackHub> hub,
                                       PeerId peer_id)
      : hub_{std::move(hub)},
        peer_id_{std::move(peer_id)},
        log_{log::createLogger("LoopbackTransport")} {}

  CoroOutcome<void> LoopbackTransport::startAdvertising(std::string name) {
    name_ = std::move(name);
    auto was_started = started();
    advertising_ = true;
    if (not was_started) {
      hub_->onStarted(peer_id_);
    }
    SL_DEBUG(log_, "{} advertising as '{}'", peer_id_, name_);
    co_return outcome::success();
  }

  CoroOutcome<void> LoopbackTransport::startDiscovery() {
    auto was_started = started();
    discovering_ = true;
    if (not was_started) {
      hub_->onStarted(peer_id_);
    }
    SL_DEBUG(log_, "{} discovering", peer_id_);
    co_return outcome::success();
  }

  CoroOutcome<void> LoopbackTransport::stopAll() {
    if (started()) {
      hub_->onStopped(peer_id_);
    }
    advertising_ = false;
    discovering_ = false;
    SL_DEBUG(log_, "{} stopped", peer_id_);
    co_return outcome::success();
  }

  outcome::result<void> LoopbackTransport::checkSend(
      const std::string &payload) {
    ++send_attempts_;
    if (not started()) {
      return TransportError::NOT_STARTED;
    }
    if (payload.size() > hub_->maxPayloadBytes()) {
      return TransportError::PAYLOAD_TOO_LARGE;
    }
    if (fail_sends_) {
      return TransportError::SEND_FAILED;
    }
    return outcome::success();
  }

  CoroOutcome<void> LoopbackTransport::sendPayload(PeerId peer,
                                                   std::string payload) {
    BOOST_OUTCOME_CO_TRY(checkSend(payload));
    if (not hub_->linked(peer_id_, peer) or not hub_->active(peer)) {
      co_return TransportError::UNKNOWN_PEER;
    }
    sent_.emplace_back(SentPayload{peer, payload});
    hub_->deliver(peer_id_, peer, std::move(payload));
    co_return outcome::success();
  }

  CoroOutcome<void> LoopbackTransport::broadcastPayload(std::string payload) {
    BOOST_OUTCOME_CO_TRY(checkSend(payload));
    sent_.emplace_back(SentPayload{std::nullopt, payload});
    for (auto &peer : hub_->connectedPeers(peer_id_)) {
      hub_->deliver(peer_id_, peer, payload);
    }
    co_return outcome::success();
  }

  size_t LoopbackTransport::maxPayloadBytes() const {
    return hub_->maxPayloadBytes();
  }

  TransportEvents &LoopbackTransport::events() {
    return events_;
  }

}  // namespace meshgossip::transport
