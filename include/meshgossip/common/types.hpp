/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace meshgossip {
  /// Opaque endpoint identifier assigned by the radio stack.
  using PeerId = std::string;

  /// Wall clock milliseconds, used on the wire.
  using TimestampMs = int64_t;

  using SteadyClock = std::chrono::steady_clock;
  using SystemClock = std::chrono::system_clock;

  inline TimestampMs nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               SystemClock::now().time_since_epoch())
        .count();
  }
}  // namespace meshgossip
