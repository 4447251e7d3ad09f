/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/execution_context.hpp>
#include <meshgossip/coro/coro.hpp>

namespace meshgossip {
  template <typename T>
  concept CoroSpawnExecutor =
      boost::asio::is_executor<std::remove_cvref_t<T>>::value
      || boost::asio::execution::is_executor<std::remove_cvref_t<T>>::value
      || std::is_convertible_v<T, boost::asio::execution_context &>;

  void coroSpawn(CoroSpawnExecutor auto &&executor, Coro<void> &&coro) {
    boost::asio::co_spawn(std::forward<decltype(executor)>(executor),
                          std::move(coro),
                          [](std::exception_ptr e) {
                            if (e != nullptr) {
                              std::rethrow_exception(e);
                            }
                          });
  }

  /**
   * Start coroutine produced by `f` on specified executor.
   * The callable is moved into the coroutine frame, so its captures outlive
   * the call: `co_spawn([capture] { ... })` alone would leave them dangling
   * once the lambda temporary is destroyed.
   */
  void coroSpawn(CoroSpawnExecutor auto &&executor, auto &&f) {
    coroSpawn(std::forward<decltype(executor)>(executor),
              [](std::remove_cvref_t<decltype(f)> f) -> Coro<void> {
                co_await f();
              }(std::forward<decltype(f)>(f)));
  }
}  // namespace meshgossip
