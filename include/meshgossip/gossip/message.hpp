/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>
#include <string>

#include <meshgossip/common/types.hpp>
#include <meshgossip/gossip/survival_post.hpp>
#include <nlohmann/json.hpp>

namespace meshgossip::gossip {
  enum class MessageType : uint8_t {
    PostList,
    PostUpdate,
    Ack,
  };

  /**
   * Send order class, lower goes first.
   */
  enum class MessagePriority : uint8_t {
    Sos = 0,
    Want = 1,
    Have = 2,
    Ack = 3,
  };

  enum class MessageError {
    MALFORMED_MESSAGE,
    UNKNOWN_TYPE,
  };

  Q_ENUM_ERROR_CODE(MessageError) {
    using E = decltype(e);
    switch (e) {
      case E::MALFORMED_MESSAGE:
        return "Gossip message field missing or mistyped";
      case E::UNKNOWN_TYPE:
        return "Unknown gossip message type";
    }
    abort();
  }

  /**
   * Wire envelope.
   * `payload` stays raw JSON so that each post can be validated on its own:
   * an array of posts for post_list/post_update, anything for ack.
   */
  struct GossipMessage {
    MessageType type = MessageType::PostUpdate;
    nlohmann::json payload;
    /// Rebroadcasts so far, 0 at origin.
    uint32_t hop_count = 0;
    /// Origination time.
    TimestampMs timestamp = 0;
    /// Originating node.
    std::string sender_id;
  };

  MessagePriority postPriority(PostKind kind);

  std::string_view messageTypeName(MessageType type);

  /**
   * Dedup identity: sender, origination time and type.
   */
  std::string messageIdentity(const GossipMessage &message);

  GossipMessage makePostMessage(MessageType type,
                                std::span<const SurvivalPost> posts,
                                std::string sender_id,
                                TimestampMs timestamp);

  std::string encodeMessage(const GossipMessage &message);

  bool isMessageJson(const nlohmann::json &j);

  outcome::result<GossipMessage> messageFromJson(const nlohmann::json &j);
}  // namespace meshgossip::gossip
