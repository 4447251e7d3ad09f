/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <meshgossip/gossip/message.hpp>

#include <limits>

#include <fmt/format.h>

namespace meshgossip::gossip {
  MessagePriority postPriority(PostKind kind) {
    switch (kind) {
      case PostKind::Sos:
        return MessagePriority::Sos;
      case PostKind::Want:
        return MessagePriority::Want;
      case PostKind::Have:
        return MessagePriority::Have;
    }
    return MessagePriority::Have;
  }

  std::string_view messageTypeName(MessageType type) {
    switch (type) {
      case MessageType::PostList:
        return "post_list";
      case MessageType::PostUpdate:
        return "post_update";
      case MessageType::Ack:
        return "ack";
    }
    abort();
  }

  std::string messageIdentity(const GossipMessage &message) {
    return fmt::format("{}-{}-{}",
                       message.sender_id,
                       message.timestamp,
                       messageTypeName(message.type));
  }

  GossipMessage makePostMessage(MessageType type,
                                std::span<const SurvivalPost> posts,
                                std::string sender_id,
                                TimestampMs timestamp) {
    auto payload = nlohmann::json::array();
    for (auto &post : posts) {
      payload.emplace_back(post);
    }
    return GossipMessage{
        .type = type,
        .payload = std::move(payload),
        .hop_count = 0,
        .timestamp = timestamp,
        .sender_id = std::move(sender_id),
    };
  }

  std::string encodeMessage(const GossipMessage &message) {
    return nlohmann::json{
        {"type", messageTypeName(message.type)},
        {"payload", message.payload},
        {"hopCount", message.hop_count},
        {"timestamp", message.timestamp},
        {"senderId", message.sender_id},
    }
        .dump();
  }

  bool isMessageJson(const nlohmann::json &j) {
    return j.is_object() and j.contains("type") and j.contains("payload");
  }

  outcome::result<GossipMessage> messageFromJson(const nlohmann::json &j) {
    if (not isMessageJson(j)) {
      return MessageError::MALFORMED_MESSAGE;
    }
    auto &type = j.at("type");
    auto hop_count = j.find("hopCount");
    auto timestamp = j.find("timestamp");
    auto sender_id = j.find("senderId");
    if (not type.is_string() or hop_count == j.end()
        or not hop_count->is_number_unsigned() or timestamp == j.end()
        or not timestamp->is_number_integer() or sender_id == j.end()
        or not sender_id->is_string()) {
      return MessageError::MALFORMED_MESSAGE;
    }
    if (hop_count->get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
      return MessageError::MALFORMED_MESSAGE;
    }
    GossipMessage message{
        .payload = j.at("payload"),
        .hop_count = hop_count->get<uint32_t>(),
        .timestamp = timestamp->get<TimestampMs>(),
        .sender_id = sender_id->get<std::string>(),
    };
    auto &name = type.get_ref<const std::string &>();
    if (name == "post_list") {
      message.type = MessageType::PostList;
    } else if (name == "post_update") {
      message.type = MessageType::PostUpdate;
    } else if (name == "ack") {
      message.type = MessageType::Ack;
    } else {
      return MessageError::UNKNOWN_TYPE;
    }
    return message;
  }
}  // namespace meshgossip::gossip
