/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/awaitable.hpp>
#include <qtils/outcome.hpp>

namespace meshgossip {
  /**
   * Return type for coroutine.
   *
   * Spawning with `coroSpawn` on an io_context that is not running leaves the
   * coroutine suspended until the context runs:
   *     boost::asio::io_context io;
   *     coroSpawn(io, []() -> Coro<void> { co_return; }); // suspended
   *     io.run_one(); // resumes
   * Engine operations rely on this: work queued before `run()` is observable
   * (queue length, pending entries) and starts only once the loop runs.
   */
  template <typename T>
  using Coro = boost::asio::awaitable<T>;

  /**
   * Return type for coroutine returning outcome.
   */
  template <typename T>
  using CoroOutcome = Coro<outcome::result<T>>;
}  // namespace meshgossip
