/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <meshgossip/coro/spawn.hpp>

namespace meshgossip {
  /**
   * Call `f` every `delay` until it returns false or `timer` is cancelled.
   * First call happens after one full `delay`.
   * Caller keeps `timer` to stop the loop deterministically.
   */
  void timerLoop(std::shared_ptr<boost::asio::steady_timer> timer,
                 std::chrono::milliseconds delay,
                 auto f) {
    auto executor = timer->get_executor();
    coroSpawn(executor,
              [timer{std::move(timer)}, delay, f{std::move(f)}]() -> Coro<void> {
                boost::system::error_code ec;
                while (true) {
                  timer->expires_after(delay);
                  co_await timer->async_wait(
                      boost::asio::redirect_error(boost::asio::use_awaitable,
                                                  ec));
                  if (ec) {
                    break;
                  }
                  if (not f()) {
                    break;
                  }
                }
              });
  }
}  // namespace meshgossip
