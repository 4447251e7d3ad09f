/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <meshgossip/framing/message_chunk.hpp>

namespace meshgossip::framing {
  /**
   * Bytes reserved in every unit for the chunk envelope (keys, messageId,
   * indices, checksum, JSON punctuation).
   */
  constexpr size_t kChunkOverheadBytes = 150;

  /// Fresh fixed-length chunk group identifier (a freshness token).
  std::string generateMessageId();

  /**
   * Split `message` into chunks whose serialized form fits `max_unit_bytes`.
   *
   * Slices are equal-sized except the last, cut on UTF-8 code point
   * boundaries. The slice budget starts at `max_unit_bytes -
   * kChunkOverheadBytes` and shrinks when JSON escaping pushes a chunk over
   * the bound, so the chunk count is a function of the inputs only.
   *
   * Returns:
   * - `EMPTY_MESSAGE` for an empty message.
   * - `NOT_UTF8` if the message cannot be carried in a JSON string.
   * - `UNIT_TOO_SMALL` if `max_unit_bytes` cannot hold the envelope.
   * - `CHUNK_CAPACITY_EXCEEDED` if no slice budget satisfies the bound.
   */
  outcome::result<std::vector<MessageChunk>> split(std::string_view message,
                                                   size_t max_unit_bytes);

  /**
   * Rebuild the original message from chunks in any order.
   * Duplicates (same index) are tolerated, the first copy wins.
   *
   * Checks, in order: `NO_CHUNKS`, `MESSAGE_ID_MISMATCH`,
   * `TOTAL_CHUNKS_MISMATCH`, `INCOMPLETE_CHUNKS` (fewer distinct indices than
   * `totalChunks`), `MISSING_OR_DUPLICATE_INDEX` (indices are not exactly
   * 0..totalChunks-1), `CHECKSUM_MISMATCH`.
   */
  outcome::result<std::string> reassemble(
      std::span<const MessageChunk> chunks);
}  // namespace meshgossip::framing
