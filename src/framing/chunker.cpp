/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <meshgossip/framing/chunker.hpp>

#include <algorithm>
#include <map>
#include <random>

#include <fmt/format.h>
#include <meshgossip/codec/codec.hpp>
#include <meshgossip/common/types.hpp>

namespace meshgossip::framing {
  namespace {
    // Cut `message` into slices of at most `budget` bytes, never splitting a
    // code point. A slice always advances by at least one code point.
    std::vector<MessageChunk> partition(std::string_view message,
                                        size_t budget,
                                        const std::string &message_id,
                                        const std::string &checksum) {
      std::vector<MessageChunk> chunks;
      size_t offset = 0;
      while (offset < message.size()) {
        auto end = codec::utf8Boundary(message, offset + budget);
        if (end <= offset) {
          end = offset + 1;
          while (end < message.size()
                 and codec::utf8Boundary(message, end) != end) {
            ++end;
          }
        }
        chunks.emplace_back(MessageChunk{
            .message_id = message_id,
            .chunk_index = static_cast<uint32_t>(chunks.size()),
            .data = std::string{message.substr(offset, end - offset)},
            .checksum = checksum,
        });
        offset = end;
      }
      for (auto &chunk : chunks) {
        chunk.total_chunks = static_cast<uint32_t>(chunks.size());
      }
      return chunks;
    }
  }  // namespace

  std::string generateMessageId() {
    thread_local std::mt19937 random{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> distribution;
    return fmt::format(
        "{:011x}-{:08x}", static_cast<uint64_t>(nowMs()), distribution(random));
  }

  outcome::result<std::vector<MessageChunk>> split(std::string_view message,
                                                   size_t max_unit_bytes) {
    if (message.empty()) {
      return ChunkError::EMPTY_MESSAGE;
    }
    if (not codec::isValidUtf8(message)) {
      return ChunkError::NOT_UTF8;
    }
    if (max_unit_bytes <= kChunkOverheadBytes) {
      return ChunkError::UNIT_TOO_SMALL;
    }
    auto message_id = generateMessageId();
    auto checksum = codec::checksum(message);

    auto budget = max_unit_bytes - kChunkOverheadBytes;
    while (true) {
      auto chunks = partition(message, budget, message_id, checksum);
      size_t excess = 0;
      for (auto &chunk : chunks) {
        auto size = encodedChunkSize(chunk);
        if (size > max_unit_bytes) {
          excess = std::max(excess, size - max_unit_bytes);
        }
      }
      if (excess == 0) {
        return chunks;
      }
      if (budget == 1) {
        break;
      }
      // Escaped text may overshoot by more than the whole budget: halve then.
      // Budget 1 (one code point per slice) is the last attempt.
      budget = excess < budget ? budget - excess
                               : std::max<size_t>(budget / 2, 1);
    }
    return ChunkError::CHUNK_CAPACITY_EXCEEDED;
  }

  outcome::result<std::string> reassemble(
      std::span<const MessageChunk> chunks) {
    if (chunks.empty()) {
      return ChunkError::NO_CHUNKS;
    }
    auto &first = chunks.front();
    for (auto &chunk : chunks) {
      if (chunk.message_id != first.message_id) {
        return ChunkError::MESSAGE_ID_MISMATCH;
      }
    }
    for (auto &chunk : chunks) {
      if (chunk.total_chunks != first.total_chunks) {
        return ChunkError::TOTAL_CHUNKS_MISMATCH;
      }
    }

    std::map<uint32_t, const MessageChunk *> by_index;
    for (auto &chunk : chunks) {
      by_index.emplace(chunk.chunk_index, &chunk);
    }
    if (by_index.size() < first.total_chunks) {
      return ChunkError::INCOMPLETE_CHUNKS;
    }
    if (by_index.size() != first.total_chunks
        or by_index.rbegin()->first != first.total_chunks - 1) {
      return ChunkError::MISSING_OR_DUPLICATE_INDEX;
    }

    std::string message;
    for (auto &[index, chunk] : by_index) {
      if (chunk->checksum != first.checksum) {
        return ChunkError::CHECKSUM_MISMATCH;
      }
      message += chunk->data;
    }
    if (codec::checksum(message) != first.checksum) {
      return ChunkError::CHECKSUM_MISMATCH;
    }
    return message;
  }
}  // namespace meshgossip::framing
