/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <meshgossip/coro/coro.hpp>

namespace meshgossip {
  /**
   * Yields execution to allow other coroutines to run.
   *
   * Posts a continuation to the current executor, so inbound transport events
   * already queued on the io_context run before the caller resumes.
   */
  inline Coro<void> coroYield() {
    co_await boost::asio::post(co_await boost::asio::this_coro::executor,
                               boost::asio::use_awaitable);
  }
}  // namespace meshgossip
