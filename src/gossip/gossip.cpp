/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <meshgossip/gossip/gossip.hpp>

#include <algorithm>
#include <random>
#include <ranges>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <fmt/format.h>
#include <meshgossip/codec/codec.hpp>
#include <meshgossip/common/weak_macro.hpp>
#include <meshgossip/coro/spawn.hpp>
#include <meshgossip/coro/yield.hpp>
#include <meshgossip/framing/chunker.hpp>

namespace meshgossip::gossip {
  Gossip::Gossip(std::shared_ptr<boost::asio::io_context> io_context,
                 std::shared_ptr<transport::TransportAdapter> transport,
                 std::shared_ptr<peer::PeerSyncRepository> peers,
                 Config config)
      : io_context_{std::move(io_context)},
        transport_{std::move(transport)},
        peers_{std::move(peers)},
        config_{std::move(config)},
        reassembler_{std::make_shared<framing::ChunkReassembler>(
            io_context_, config_.reassembly)},
        seen_{config_.seen_cache_limit},
        delay_timer_{std::make_shared<boost::asio::steady_timer>(*io_context_)},
        log_{log::createLogger("Gossip")} {
    if (config_.device_id.empty()) {
      config_.device_id =
          fmt::format("node-{:08x}", std::random_device{}());
    }
  }

  // Subscribe to transport events, bring the radio up, then start sending.
  void Gossip::start() {
    if (running_) {
      return;
    }
    running_ = true;
    auto &events = transport_->events();
    subscriptions_.emplace_back(events.payload_received.connect(
        [WEAK_SELF](const PeerId &peer, const std::string &payload) {
          WEAK_LOCK(self);
          self->onPayload(peer, payload);
        }));
    subscriptions_.emplace_back(events.endpoint_found.connect(
        [WEAK_SELF](const PeerId &peer, const std::string &name) {
          WEAK_LOCK(self);
          self->onEndpointFound(peer, name);
        }));
    subscriptions_.emplace_back(
        events.endpoint_lost.connect([WEAK_SELF](const PeerId &peer) {
          WEAK_LOCK(self);
          self->onEndpointLost(peer);
        }));
    reassembler_->start();

    coroSpawn(*io_context_, [self{shared_from_this()}]() -> Coro<void> {
      auto &transport = self->transport_;
      auto advertising =
          co_await transport->startAdvertising(self->config_.advertise_name);
      if (not advertising.has_value()) {
        SL_ERROR(self->log_,
                 "start advertising failed: {}",
                 advertising.error().message());
      }
      auto discovery = co_await transport->startDiscovery();
      if (not discovery.has_value()) {
        SL_ERROR(self->log_,
                 "start discovery failed: {}",
                 discovery.error().message());
      }
      if (not self->running_) {
        co_return;
      }
      self->transport_ready_ = true;
      SL_INFO(self->log_,
              "started as {}, {} messages queued",
              self->config_.device_id,
              self->queue_.size());
      self->checkDrain();
    });
  }

  void Gossip::stop() {
    if (not running_) {
      return;
    }
    running_ = false;
    transport_ready_ = false;
    subscriptions_.clear();
    delay_timer_->cancel();
    for (auto &timer : retry_timers_) {
      timer->cancel();
    }
    retry_timers_.clear();
    reassembler_->stop();
    coroSpawn(*io_context_, [self{shared_from_this()}]() -> Coro<void> {
      auto r = co_await self->transport_->stopAll();
      if (not r.has_value()) {
        SL_WARN(self->log_, "stop transport failed: {}", r.error().message());
      }
      SL_INFO(self->log_, "stopped, {} messages left queued", self->queue_.size());
    });
  }

  outcome::result<void> Gossip::addLocalPost(SurvivalPost post) {
    BOOST_OUTCOME_TRY(validatePost(post, config_.post_limits));
    auto message = originate(MessageType::PostUpdate, std::span{&post, 1});
    auto priority = postPriority(post.kind);
    SL_DEBUG(log_, "local {} post {}", kindCode(post.kind), post.id);
    local_posts_.insert_or_assign(post.id, std::move(post));
    enqueue(QueueEntry{.message = std::move(message), .priority = priority});
    return outcome::success();
  }

  outcome::result<void> Gossip::updateLocalPost(SurvivalPost post) {
    auto it = local_posts_.find(post.id);
    if (it == local_posts_.end()) {
      return GossipError::UNKNOWN_POST;
    }
    BOOST_OUTCOME_TRY(validatePost(post, config_.post_limits));
    auto message = originate(MessageType::PostUpdate, std::span{&post, 1});
    auto priority = postPriority(post.kind);
    it->second = std::move(post);
    enqueue(QueueEntry{.message = std::move(message), .priority = priority});
    return outcome::success();
  }

  bool Gossip::removeLocalPost(const std::string &id) {
    return local_posts_.erase(id) != 0;
  }

  void Gossip::broadcastLocalPosts() {
    if (local_posts_.empty()) {
      return;
    }
    auto posts = getLocalPosts();
    std::ranges::stable_sort(posts, {}, [](const SurvivalPost &post) {
      return postPriority(post.kind);
    });
    auto priority = postPriority(posts.front().kind);
    SL_DEBUG(log_, "broadcasting {} local posts", posts.size());
    enqueue(QueueEntry{
        .message = originate(MessageType::PostList, posts),
        .priority = priority,
    });
  }

  std::vector<SurvivalPost> Gossip::receiveMessage(const GossipMessage &message,
                                                   const PeerId &from) {
    if (message.hop_count >= config_.max_hops) {
      SL_TRACE(log_,
               "{} from {} dropped, hop count {}",
               messageTypeName(message.type),
               from,
               message.hop_count);
      return {};
    }
    if (not seen_.insert(messageIdentity(message))) {
      SL_TRACE(log_, "duplicate {} from {}", messageTypeName(message.type), from);
      return {};
    }

    std::vector<SurvivalPost> new_posts;
    if (message.type == MessageType::Ack) {
      SL_DEBUG(log_, "ack from {}: {}", from, message.payload.dump());
    } else if (not message.payload.is_array()) {
      SL_DEBUG(log_,
               "{} from {} without post list",
               messageTypeName(message.type),
               from);
    } else {
      for (auto &item : message.payload) {
        auto post_result = postFromJson(item, config_.post_limits);
        if (not post_result.has_value()) {
          SL_DEBUG(log_,
                   "invalid post from {}: {}",
                   from,
                   post_result.error().message());
          continue;
        }
        auto &post = post_result.value();
        if (local_posts_.contains(post.id)) {
          continue;
        }
        local_posts_.emplace(post.id, post);
        new_posts.emplace_back(std::move(post));
      }
    }
    peers_->recordMessage(from, nowMs());

    if (new_posts.empty()) {
      return new_posts;
    }
    auto priority = std::ranges::min(
        new_posts | std::views::transform([](const SurvivalPost &post) {
          return postPriority(post.kind);
        }));
    auto forward = message;
    ++forward.hop_count;
    SL_DEBUG(log_,
             "{} new posts from {}, forwarding at hop {}",
             new_posts.size(),
             from,
             forward.hop_count);
    enqueue(QueueEntry{.message = std::move(forward), .priority = priority});
    if (config_.send_acks) {
      queueAck(from, new_posts);
    }
    return new_posts;
  }

  void Gossip::onPayload(const PeerId &from, const std::string &payload) {
    auto j = nlohmann::json::parse(payload, nullptr, false);
    if (j.is_discarded()) {
      SL_WARN(log_, "unparsable payload from {} ({} bytes)", from, payload.size());
      return;
    }
    if (not framing::isChunkJson(j)) {
      onPayloadJson(from, j);
      return;
    }
    auto chunk = framing::chunkFromJson(j);
    if (not chunk.has_value()) {
      SL_WARN(log_, "bad chunk from {}: {}", from, chunk.error().message());
      return;
    }
    auto complete = reassembler_->addChunk(std::move(chunk.value()));
    if (not complete.has_value()) {
      SL_DEBUG(log_,
               "chunk from {} rejected: {}",
               from,
               complete.error().message());
      return;
    }
    if (complete.value().has_value()) {
      onReassembled(from, *complete.value());
    }
  }

  // Reassembled body is either the message JSON or its compressed form.
  void Gossip::onReassembled(const PeerId &from, const std::string &text) {
    if (text.size() > config_.max_message_bytes) {
      SL_WARN(log_,
              "oversized message from {} ({} bytes) dropped",
              from,
              text.size());
      return;
    }
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
      auto inflated = codec::decompress(text, config_.max_message_bytes);
      if (not inflated.has_value()) {
        SL_WARN(log_,
                "undecodable message from {}: {}",
                from,
                inflated.error().message());
        return;
      }
      j = nlohmann::json::parse(inflated.value(), nullptr, false);
      if (j.is_discarded()) {
        SL_WARN(log_, "unparsable message from {}", from);
        return;
      }
    }
    onPayloadJson(from, j);
  }

  void Gossip::onPayloadJson(const PeerId &from, const nlohmann::json &j) {
    auto message = messageFromJson(j);
    if (not message.has_value()) {
      SL_WARN(log_, "bad message from {}: {}", from, message.error().message());
      return;
    }
    receiveMessage(message.value(), from);
  }

  void Gossip::handlePartitionHeal(const PeerId &peer) {
    SL_INFO(log_, "{} is back, resyncing {} posts", peer, local_posts_.size());
    broadcastLocalPosts();
  }

  outcome::result<std::vector<std::string>> Gossip::framePayloads(
      const GossipMessage &message) const {
    auto limit = std::min(config_.max_payload_bytes,
                          transport_->maxPayloadBytes());
    auto encoded = encodeMessage(message);
    if (codec::byteSize(encoded) > config_.max_message_bytes) {
      return GossipError::MESSAGE_TOO_LARGE;
    }
    if (codec::byteSize(encoded) <= limit) {
      return std::vector<std::string>{std::move(encoded)};
    }
    auto compressed = codec::compress(encoded);
    if (not compressed.has_value()) {
      SL_WARN(log_, "compress failed: {}", compressed.error().message());
    }
    auto &body = compressed.has_value()
                     and compressed.value().size() < encoded.size()
                   ? compressed.value()
                   : encoded;
    BOOST_OUTCOME_TRY(auto chunks, framing::split(body, limit));
    std::vector<std::string> payloads;
    payloads.reserve(chunks.size());
    for (auto &chunk : chunks) {
      payloads.emplace_back(framing::encodeChunk(chunk));
    }
    return payloads;
  }

  std::vector<SurvivalPost> Gossip::getLocalPosts() const {
    std::vector<SurvivalPost> posts;
    posts.reserve(local_posts_.size());
    for (auto &post : local_posts_ | std::views::values) {
      posts.emplace_back(post);
    }
    return posts;
  }

  std::vector<peer::PeerSyncStatus> Gossip::getPeerSyncStatus() const {
    return peers_->getAll();
  }

  std::optional<peer::PeerSyncStatus> Gossip::getPeerSyncStatus(
      const PeerId &peer) const {
    return peers_->get(peer);
  }

  QueueStats Gossip::getQueueStats() const {
    return QueueStats{
        .queue_length = queue_.size(),
        .is_processing = processing_,
        .in_flight = in_flight_,
        .local_post_count = local_posts_.size(),
        .seen_message_count = seen_.size(),
        .peer_count = peers_->size(),
        .partial_reassembly_count = reassembler_->partialCount(),
        .pending_retries = retry_timers_.size(),
        .dropped_count = dropped_,
    };
  }

  std::vector<QueueEntry> Gossip::pendingEntries() const {
    return queue_.snapshot();
  }

  GossipMessage Gossip::originate(MessageType type,
                                  std::span<const SurvivalPost> posts) {
    auto message =
        makePostMessage(type, posts, config_.device_id, nextTimestamp());
    seen_.insert(messageIdentity(message));
    return message;
  }

  void Gossip::queueAck(const PeerId &peer,
                        const std::vector<SurvivalPost> &posts) {
    auto ids = nlohmann::json::array();
    for (auto &post : posts) {
      ids.emplace_back(post.id);
    }
    GossipMessage ack{
        .type = MessageType::Ack,
        .payload = std::move(ids),
        .hop_count = 0,
        .timestamp = nextTimestamp(),
        .sender_id = config_.device_id,
    };
    seen_.insert(messageIdentity(ack));
    enqueue(QueueEntry{
        .message = std::move(ack),
        .priority = MessagePriority::Ack,
        .target = peer,
    });
  }

  // Strictly increasing, so identities of messages originated here never
  // collide even within one millisecond.
  TimestampMs Gossip::nextTimestamp() {
    last_timestamp_ = std::max(nowMs(), last_timestamp_ + 1);
    return last_timestamp_;
  }

  void Gossip::enqueue(QueueEntry entry) {
    queue_.push(std::move(entry));
    checkDrain();
  }

  void Gossip::checkDrain() {
    if (processing_ or not transport_ready_ or queue_.empty()) {
      return;
    }
    processing_ = true;
    coroSpawn(*io_context_, [self{shared_from_this()}]() -> Coro<void> {
      co_await self->drain();
    });
  }

  // Sender coroutine: one message at a time, most urgent first, with a pause
  // after every attempt.
  Coro<void> Gossip::drain() {
    // let the current handler finish enqueueing, so the most urgent goes first
    co_await coroYield();
    while (running_ and transport_ready_) {
      auto entry = queue_.pop();
      if (not entry.has_value()) {
        break;
      }
      auto payloads = framePayloads(entry->message);
      if (not payloads.has_value()) {
        ++dropped_;
        SL_ERROR(log_,
                 "{} message cannot be framed, dropped: {}",
                 messageTypeName(entry->message.type),
                 payloads.error().message());
      } else {
        in_flight_ = true;
        auto r = co_await sendEntry(*entry, std::move(payloads.value()));
        in_flight_ = false;
        if (r.has_value()) {
          SL_TRACE(log_,
                   "sent {} hop {}",
                   messageTypeName(entry->message.type),
                   entry->message.hop_count);
        } else if (r.error() == transport::TransportError::PAYLOAD_TOO_LARGE) {
          ++dropped_;
          SL_ERROR(log_,
                   "{} message exceeds transport capacity, dropped",
                   messageTypeName(entry->message.type));
        } else {
          scheduleRetry(std::move(entry.value()), r.error());
        }
      }
      if (not running_) {
        break;
      }
      delay_timer_->expires_after(config_.inter_send_delay);
      boost::system::error_code ec;
      co_await delay_timer_->async_wait(
          boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    processing_ = false;
  }

  CoroOutcome<void> Gossip::sendEntry(const QueueEntry &entry,
                                      std::vector<std::string> payloads) {
    for (auto &payload : payloads) {
      if (entry.target.has_value()) {
        BOOST_OUTCOME_CO_TRY(
            co_await transport_->sendPayload(*entry.target, std::move(payload)));
      } else {
        BOOST_OUTCOME_CO_TRY(
            co_await transport_->broadcastPayload(std::move(payload)));
      }
    }
    co_return outcome::success();
  }

  void Gossip::scheduleRetry(QueueEntry entry, const std::error_code &error) {
    if (not running_) {
      ++dropped_;
      SL_DEBUG(log_, "send failed while stopping: {}", error.message());
      return;
    }
    if (entry.retry_count >= config_.retry_backoff.size()) {
      ++dropped_;
      SL_WARN(log_,
              "{} message dropped after {} attempts: {}",
              messageTypeName(entry.message.type),
              entry.retry_count + 1,
              error.message());
      return;
    }
    auto delay = config_.retry_backoff.at(entry.retry_count);
    ++entry.retry_count;
    SL_DEBUG(log_,
             "send failed: {}, retry {} in {}ms",
             error.message(),
             entry.retry_count,
             delay.count());
    auto timer = std::make_shared<boost::asio::steady_timer>(*io_context_, delay);
    retry_timers_.emplace(timer);
    timer->async_wait([WEAK_SELF, timer, entry{std::move(entry)}](
                          boost::system::error_code ec) mutable {
      WEAK_LOCK(self);
      self->retry_timers_.erase(timer);
      if (ec or not self->running_) {
        ++self->dropped_;
        return;
      }
      self->enqueue(std::move(entry));
    });
  }

  void Gossip::onEndpointFound(const PeerId &peer, const std::string &name) {
    auto was_connected = peers_->setConnected(peer, true);
    SL_DEBUG(log_, "found {} '{}'", peer, name);
    if (was_connected.has_value() and not was_connected.value()) {
      handlePartitionHeal(peer);
    }
  }

  void Gossip::onEndpointLost(const PeerId &peer) {
    if (not peers_->get(peer).has_value()) {
      return;
    }
    SL_DEBUG(log_, "lost {}", peer);
    peers_->setConnected(peer, false);
  }
}  // namespace meshgossip::gossip
