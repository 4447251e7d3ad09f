/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace meshgossip::framing {

  /**
   * Errors of chunk framing and reassembly.
   */
  enum class ChunkError {
    EMPTY_MESSAGE,
    NOT_UTF8,
    UNIT_TOO_SMALL,
    CHUNK_CAPACITY_EXCEEDED,
    NO_CHUNKS,
    MESSAGE_ID_MISMATCH,
    TOTAL_CHUNKS_MISMATCH,
    INCOMPLETE_CHUNKS,
    MISSING_OR_DUPLICATE_INDEX,
    CHECKSUM_MISMATCH,
    MALFORMED_CHUNK,
  };

  Q_ENUM_ERROR_CODE(ChunkError) {
    using E = decltype(e);
    switch (e) {
      case E::EMPTY_MESSAGE:
        return "Cannot split empty message into chunks";
      case E::NOT_UTF8:
        return "Message is not valid UTF-8";
      case E::UNIT_TOO_SMALL:
        return "Max unit size cannot fit chunk metadata";
      case E::CHUNK_CAPACITY_EXCEEDED:
        return "Message cannot be framed within max unit size";
      case E::NO_CHUNKS:
        return "Cannot reassemble empty chunk set";
      case E::MESSAGE_ID_MISMATCH:
        return "Chunks disagree on messageId";
      case E::TOTAL_CHUNKS_MISMATCH:
        return "Chunks disagree on totalChunks";
      case E::INCOMPLETE_CHUNKS:
        return "Not all chunks of the message are present";
      case E::MISSING_OR_DUPLICATE_INDEX:
        return "Chunk indices have a gap";
      case E::CHECKSUM_MISMATCH:
        return "Reassembled message checksum mismatch";
      case E::MALFORMED_CHUNK:
        return "Malformed chunk";
    }
    abort();
  }

  /**
   * Framing unit of one oversized message.
   * All chunks of a message share `message_id`, `total_chunks` and
   * `checksum`; the latter covers the whole reconstructed message.
   */
  struct MessageChunk {
    std::string message_id;
    uint32_t chunk_index = 0;
    uint32_t total_chunks = 0;
    std::string data;
    std::string checksum;

    bool operator==(const MessageChunk &) const = default;
  };

  void to_json(nlohmann::json &j, const MessageChunk &chunk);

  /// Serialized JSON form, as sent on the wire.
  std::string encodeChunk(const MessageChunk &chunk);

  /// Size of `encodeChunk(chunk)` in bytes.
  size_t encodedChunkSize(const MessageChunk &chunk);

  /**
   * Parse an already decoded JSON object as a chunk.
   * Returns `MALFORMED_CHUNK` if any field is missing or mistyped.
   */
  outcome::result<MessageChunk> chunkFromJson(const nlohmann::json &j);

  /// True if `j` carries the chunk envelope fields.
  bool isChunkJson(const nlohmann::json &j);
}  // namespace meshgossip::framing
