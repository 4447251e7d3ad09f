/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <meshgossip/framing/message_chunk.hpp>

#include <limits>

#include <nlohmann/json.hpp>

namespace meshgossip::framing {
  namespace field {
    constexpr auto kMessageId = "messageId";
    constexpr auto kChunkIndex = "chunkIndex";
    constexpr auto kTotalChunks = "totalChunks";
    constexpr auto kData = "data";
    constexpr auto kChecksum = "checksum";
  }  // namespace field

  void to_json(nlohmann::json &j, const MessageChunk &chunk) {
    j = nlohmann::json{
        {field::kMessageId, chunk.message_id},
        {field::kChunkIndex, chunk.chunk_index},
        {field::kTotalChunks, chunk.total_chunks},
        {field::kData, chunk.data},
        {field::kChecksum, chunk.checksum},
    };
  }

  std::string encodeChunk(const MessageChunk &chunk) {
    return nlohmann::json(chunk).dump();
  }

  size_t encodedChunkSize(const MessageChunk &chunk) {
    return encodeChunk(chunk).size();
  }

  bool isChunkJson(const nlohmann::json &j) {
    return j.is_object() and j.contains(field::kMessageId)
       and j.contains(field::kChunkIndex);
  }

  outcome::result<MessageChunk> chunkFromJson(const nlohmann::json &j) {
    if (not j.is_object()) {
      return ChunkError::MALFORMED_CHUNK;
    }
    auto message_id = j.find(field::kMessageId);
    auto chunk_index = j.find(field::kChunkIndex);
    auto total_chunks = j.find(field::kTotalChunks);
    auto data = j.find(field::kData);
    auto checksum = j.find(field::kChecksum);
    if (message_id == j.end() or not message_id->is_string()
        or chunk_index == j.end() or not chunk_index->is_number_unsigned()
        or total_chunks == j.end() or not total_chunks->is_number_unsigned()
        or data == j.end() or not data->is_string() or checksum == j.end()
        or not checksum->is_string()) {
      return ChunkError::MALFORMED_CHUNK;
    }
    constexpr uint64_t kMaxIndex = std::numeric_limits<uint32_t>::max();
    if (chunk_index->get<uint64_t>() > kMaxIndex
        or total_chunks->get<uint64_t>() > kMaxIndex) {
      return ChunkError::MALFORMED_CHUNK;
    }
    MessageChunk chunk{
        .message_id = message_id->get<std::string>(),
        .chunk_index = chunk_index->get<uint32_t>(),
        .total_chunks = total_chunks->get<uint32_t>(),
        .data = data->get<std::string>(),
        .checksum = checksum->get<std::string>(),
    };
    return chunk;
  }
}  // namespace meshgossip::framing
