/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <meshgossip/log/logger.hpp>
#include <meshgossip/transport/transport_adapter.hpp>

namespace meshgossip::transport {
  class LoopbackTransport;

  /**
   * In-process radio neighbourhood.
   *
   * Nodes are created by the hub and talk only over links set with `link`.
   * A link is usable once both ends started advertising or discovery;
   * `endpoint_found` fires on both ends at that moment, `endpoint_lost` when
   * the link goes away. Every delivery and event is posted to the hub's
   * io_context, never invoked inline.
   */
  class LoopbackHub : public std::enable_shared_from_this<LoopbackHub> {
   public:
    LoopbackHub(std::shared_ptr<boost::asio::io_context> io_context,
                size_t max_payload_bytes = 512);

    std::shared_ptr<LoopbackTransport> createNode(PeerId peer_id);

    /// Put `a` and `b` in radio range of each other.
    void link(const PeerId &a, const PeerId &b);

    /// Take `a` and `b` out of range.
    void unlink(const PeerId &a, const PeerId &b);

    bool linked(const PeerId &a, const PeerId &b) const;

    /// Started nodes in range of `peer_id`.
    std::vector<PeerId> connectedPeers(const PeerId &peer_id) const;

    size_t maxPayloadBytes() const;

   private:
    friend class LoopbackTransport;

    using Link = std::pair<PeerId, PeerId>;

    static Link makeLink(const PeerId &a, const PeerId &b);

    std::shared_ptr<LoopbackTransport> node(const PeerId &peer_id) const;

    bool active(const PeerId &peer_id) const;

    void onStarted(const PeerId &peer_id);

    void onStopped(const PeerId &peer_id);

    void postFound(const PeerId &to, const PeerId &peer);

    void postLost(const PeerId &to, const PeerId &peer);

    void deliver(const PeerId &from, const PeerId &to, std::string payload);

    std::shared_ptr<boost::asio::io_context> io_context_;
    size_t max_payload_bytes_;
    std::map<PeerId, std::weak_ptr<LoopbackTransport>> nodes_;
    std::set<Link> links_;
  };

  /**
   * Transport endpoint of a `LoopbackHub`.
   * Records every payload it sends and can be told to fail sends.
   */
  class LoopbackTransport
      : public TransportAdapter,
        public std::enable_shared_from_this<LoopbackTransport> {
   public:
    struct SentPayload {
      /// Empty for broadcast.
      std::optional<PeerId> to;
      std::string payload;
    };

    LoopbackTransport(std::shared_ptr<LoopbackHub> hub, PeerId peer_id);

    CoroOutcome<void> startAdvertising(std::string name) override;

    CoroOutcome<void> startDiscovery() override;

    CoroOutcome<void> stopAll() override;

    CoroOutcome<void> sendPayload(PeerId peer, std::string payload) override;

    CoroOutcome<void> broadcastPayload(std::string payload) override;

    size_t maxPayloadBytes() const override;

    TransportEvents &events() override;

    const PeerId &peerId() const {
      return peer_id_;
    }

    const std::string &advertisedName() const {
      return name_;
    }

    bool started() const {
      return advertising_ or discovering_;
    }

    /// Make every following send fail with `SEND_FAILED`.
    void setFailSends(bool fail) {
      fail_sends_ = fail;
    }

    /// Send calls made, including failed ones.
    size_t sendAttempts() const {
      return send_attempts_;
    }

    /// Payloads accepted for delivery.
    const std::vector<SentPayload> &sent() const {
      return sent_;
    }

   private:
    outcome::result<void> checkSend(const std::string &payload);

    std::shared_ptr<LoopbackHub> hub_;
    PeerId peer_id_;
    std::string name_;
    TransportEvents events_;
    bool advertising_ = false;
    bool discovering_ = false;
    bool fail_sends_ = false;
    size_t send_attempts_ = 0;
    std::vector<SentPayload> sent_;
    log::Logger log_;
  };
}  // namespace meshgossip::transport
