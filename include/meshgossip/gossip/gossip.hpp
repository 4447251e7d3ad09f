/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <span>
#include <unordered_set>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/signals2/connection.hpp>
#include <meshgossip/coro/coro.hpp>
#include <meshgossip/framing/chunk_reassembler.hpp>
#include <meshgossip/gossip/config.hpp>
#include <meshgossip/gossip/message.hpp>
#include <meshgossip/gossip/seen_cache.hpp>
#include <meshgossip/gossip/send_queue.hpp>
#include <meshgossip/log/logger.hpp>
#include <meshgossip/peer/peer_sync_repository.hpp>
#include <meshgossip/transport/transport_adapter.hpp>

namespace meshgossip::gossip {
  enum class GossipError {
    UNKNOWN_POST,
    MESSAGE_TOO_LARGE,
  };

  Q_ENUM_ERROR_CODE(GossipError) {
    using E = decltype(e);
    switch (e) {
      case E::UNKNOWN_POST:
        return "No local post with this id";
      case E::MESSAGE_TOO_LARGE:
        return "Encoded message exceeds the message size limit";
    }
    abort();
  }

  struct QueueStats {
    size_t queue_length = 0;
    /// Drain loop is running.
    bool is_processing = false;
    /// A message is being handed to the transport right now.
    bool in_flight = false;
    size_t local_post_count = 0;
    size_t seen_message_count = 0;
    size_t peer_count = 0;
    size_t partial_reassembly_count = 0;
    /// Failed messages waiting for their backoff to elapse.
    size_t pending_retries = 0;
    /// Messages given up on (retries exhausted or too large to frame).
    size_t dropped_count = 0;
  };

  /**
   * Flood gossip of survival posts over a short range transport.
   *
   * Every node keeps the set of posts it knows. New posts, local or
   * received, are flooded to all neighbours with a hop count; receivers
   * dedup by message identity and rebroadcast only when they learned
   * something. When a lost neighbour comes back the whole local set is
   * rebroadcast so both sides of a partition converge.
   *
   * All methods must be called on the io_context thread.
   */
  class Gossip : public std::enable_shared_from_this<Gossip> {
   public:
    Gossip(std::shared_ptr<boost::asio::io_context> io_context,
           std::shared_ptr<transport::TransportAdapter> transport,
           std::shared_ptr<peer::PeerSyncRepository> peers,
           Config config);

    /**
     * Subscribe to transport events, start advertising and discovery, then
     * start draining the send queue. Posts added before `start` stay queued.
     */
    void start();

    /**
     * Unsubscribe, cancel retries and the reassembly sweep, stop the
     * transport. A send already in flight completes first.
     */
    void stop();

    /**
     * Validate, store and enqueue a post_update carrying `post`.
     * A post with the same id is replaced.
     */
    outcome::result<void> addLocalPost(SurvivalPost post);

    /// Replace a known post (e.g. resolved SOS, new responder) and rebroadcast.
    outcome::result<void> updateLocalPost(SurvivalPost post);

    /// Forget a post. Copies already flooded are not recalled.
    bool removeLocalPost(const std::string &id);

    /**
     * Enqueue one post_list with every known post, most urgent first.
     * Does nothing when no posts are known.
     */
    void broadcastLocalPosts();

    /**
     * Process a decoded message from `from`.
     * @return posts that were not known before, in payload order.
     */
    std::vector<SurvivalPost> receiveMessage(const GossipMessage &message,
                                             const PeerId &from);

    /// Raw transport payload: a message or a chunk of one.
    void onPayload(const PeerId &from, const std::string &payload);

    /// Resync with a peer that was out of range.
    void handlePartitionHeal(const PeerId &peer);

    /**
     * Wire payloads for `message`, each within the payload limit.
     * JSON as is when it fits; otherwise chunks of the JSON, or of its
     * compressed form when that is smaller.
     */
    outcome::result<std::vector<std::string>> framePayloads(
        const GossipMessage &message) const;

    std::vector<SurvivalPost> getLocalPosts() const;

    std::vector<peer::PeerSyncStatus> getPeerSyncStatus() const;

    std::optional<peer::PeerSyncStatus> getPeerSyncStatus(
        const PeerId &peer) const;

    QueueStats getQueueStats() const;

    /// Queued messages in send order.
    std::vector<QueueEntry> pendingEntries() const;

    const std::string &deviceId() const {
      return config_.device_id;
    }

    const Config &config() const {
      return config_;
    }

   private:
    /// Post message originated here, already marked seen.
    GossipMessage originate(MessageType type,
                            std::span<const SurvivalPost> posts);

    void queueAck(const PeerId &peer, const std::vector<SurvivalPost> &posts);

    TimestampMs nextTimestamp();

    void enqueue(QueueEntry entry);

    void checkDrain();

    Coro<void> drain();

    CoroOutcome<void> sendEntry(const QueueEntry &entry,
                                std::vector<std::string> payloads);

    void scheduleRetry(QueueEntry entry, const std::error_code &error);

    void onPayloadJson(const PeerId &from, const nlohmann::json &j);

    void onReassembled(const PeerId &from, const std::string &text);

    void onEndpointFound(const PeerId &peer, const std::string &name);

    void onEndpointLost(const PeerId &peer);

    std::shared_ptr<boost::asio::io_context> io_context_;
    std::shared_ptr<transport::TransportAdapter> transport_;
    std::shared_ptr<peer::PeerSyncRepository> peers_;
    Config config_;
    std::shared_ptr<framing::ChunkReassembler> reassembler_;
    std::map<std::string, SurvivalPost> local_posts_;
    SeenCache seen_;
    SendQueue queue_;
    TimestampMs last_timestamp_ = 0;
    bool running_ = false;
    bool transport_ready_ = false;
    bool processing_ = false;
    bool in_flight_ = false;
    size_t dropped_ = 0;
    std::shared_ptr<boost::asio::steady_timer> delay_timer_;
    std::unordered_set<std::shared_ptr<boost::asio::steady_timer>>
        retry_timers_;
    std::vector<boost::signals2::scoped_connection> subscriptions_;
    log::Logger log_;
  };
}  // namespace meshgossip::gossip
