/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

/**
 * Transport callbacks and timers may fire after the engine that registered
 * them is gone. Capture a weak reference and bail out if it expired:
 *
 *    events.payload_received.connect(
 *        [WEAK_SELF](const PeerId &peer, const std::string &payload) {
 *          WEAK_LOCK(self);          // returns if the engine was destroyed
 *          self->onPayload(peer, payload);
 *        });
 *
 *    timerLoop(timer, period, [WEAK_SELF] {
 *      IF_WEAK_LOCK(self) {          // scoped variant
 *        self->sweep();
 *        return true;
 *      }
 *      return false;
 *    });
 *
 * The enclosing type must inherit std::enable_shared_from_this<T>.
 */
#define WEAK_SELF          \
  weak_self {              \
    this->weak_from_this() \
  }

#define WEAK_LOCK(name)           \
  auto name = weak_##name.lock(); \
  if (not name) return;

#define IF_WEAK_LOCK(name) if (auto name = weak_##name.lock())
