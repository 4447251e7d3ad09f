/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <meshgossip/framing/chunk_reassembler.hpp>

#include <vector>

#include <meshgossip/common/weak_macro.hpp>
#include <meshgossip/coro/timer_loop.hpp>
#include <meshgossip/framing/chunker.hpp>

namespace meshgossip::framing {
  ChunkReassembler::ChunkReassembler(
      std::shared_ptr<boost::asio::io_context> io_context,
      ReassemblerConfig config)
      : io_context_{std::move(io_context)},
        config_{config},
        log_{log::createLogger("ChunkReassembler")} {}

  void ChunkReassembler::start() {
    if (sweep_timer_ != nullptr) {
      return;
    }
    sweep_timer_ = std::make_shared<boost::asio::steady_timer>(*io_context_);
    timerLoop(sweep_timer_, config_.sweep_interval, [WEAK_SELF] {
      IF_WEAK_LOCK(self) {
        self->sweep();
        return true;
      }
      return false;
    });
  }

  void ChunkReassembler::stop() {
    if (sweep_timer_ != nullptr) {
      sweep_timer_->cancel();
      sweep_timer_.reset();
    }
    clear();
  }

  outcome::result<std::optional<std::string>> ChunkReassembler::addChunk(
      MessageChunk chunk, Clock::time_point now) {
    if (chunk.chunk_index >= chunk.total_chunks) {
      return ChunkError::MALFORMED_CHUNK;
    }
    auto it = partial_.find(chunk.message_id);
    if (it == partial_.end()) {
      it = partial_
               .emplace(chunk.message_id,
                        Partial{
                            .total_chunks = chunk.total_chunks,
                            .first_seen = now,
                        })
               .first;
    } else if (it->second.total_chunks != chunk.total_chunks) {
      SL_DEBUG(log_,
               "chunk {}#{} claims {} chunks, group has {}",
               chunk.message_id,
               chunk.chunk_index,
               chunk.total_chunks,
               it->second.total_chunks);
      return ChunkError::TOTAL_CHUNKS_MISMATCH;
    }
    auto &partial = it->second;
    auto index = chunk.chunk_index;
    partial.chunks.emplace(index, std::move(chunk));
    if (partial.chunks.size() < partial.total_chunks) {
      return std::nullopt;
    }

    std::vector<MessageChunk> complete;
    complete.reserve(partial.chunks.size());
    for (auto &entry : partial.chunks) {
      complete.emplace_back(std::move(entry.second));
    }
    partial_.erase(it);

    auto message = reassemble(complete);
    if (not message.has_value()) {
      SL_WARN(log_,
              "discard message {}: {}",
              complete.front().message_id,
              message.error().message());
      return message.error();
    }
    return std::make_optional(std::move(message.value()));
  }

  size_t ChunkReassembler::sweep(Clock::time_point now) {
    size_t evicted = 0;
    for (auto it = partial_.begin(); it != partial_.end();) {
      if (now - it->second.first_seen > config_.timeout) {
        it = partial_.erase(it);
        ++evicted;
      } else {
        ++it;
      }
    }
    if (evicted != 0) {
      SL_WARN(log_, "cleaned up {} timed-out partial messages", evicted);
    }
    return evicted;
  }

  size_t ChunkReassembler::partialCount() const {
    return partial_.size();
  }

  void ChunkReassembler::clear() {
    partial_.clear();
  }
}  // namespace meshgossip::framing
