/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <charconv>
#include <optional>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <meshgossip/coro/spawn.hpp>
#include <meshgossip/gossip/gossip.hpp>
#include <meshgossip/log/simple.hpp>
#include <meshgossip/peer/inmem_peer_sync_repository.hpp>
#include <meshgossip/transport/loopback_transport.hpp>

// Example: survival post gossip in a simulated neighbourhood
// How to run:
//     ./mesh_sim_example [nodes] [log level]
// Nodes are houses on one street, each in radio range of its neighbours only.
// House 1 raises an SOS that floods down the street. The street is then cut
// in the middle, both halves post offers, and the halves resync once the
// link comes back.
// Tunables are read from MESHGOSSIP_* environment variables.

using meshgossip::gossip::PostKind;
using meshgossip::gossip::SosCategory;
using namespace std::chrono_literals;

namespace {
  std::string houseName(size_t index) {
    return fmt::format("house-{}", index + 1);
  }

  std::optional<size_t> parseCount(std::string_view str) {
    size_t num = 0;
    auto r = std::from_chars(str.data(), str.data() + str.size(), num);
    if (r.ec != std::errc{} or r.ptr != str.data() + str.size()) {
      return std::nullopt;
    }
    return num;
  }
}  // namespace

int main(int argc, char **argv) {
  auto count = argc > 1 ? parseCount(argv[1]) : std::optional<size_t>{4};
  if (not count.has_value() or *count < 2) {
    fmt::print(stderr, "usage: mesh_sim_example [nodes >= 2] [log level]\n");
    return EXIT_FAILURE;
  }
  meshgossip::simpleLoggingSystem(argc > 2 ? argv[2] : "info");
  auto log = meshgossip::log::createLogger("mesh-sim");

  auto config_result = meshgossip::gossip::configFromEnv();
  if (not config_result.has_value()) {
    log->error("bad environment: {}", config_result.error().message());
    return EXIT_FAILURE;
  }
  auto base_config = config_result.value();

  auto io_context = std::make_shared<boost::asio::io_context>();
  auto hub = std::make_shared<meshgossip::transport::LoopbackHub>(
      io_context, base_config.max_payload_bytes);

  std::vector<std::shared_ptr<meshgossip::gossip::Gossip>> houses;
  for (size_t i = 0; i < *count; ++i) {
    auto config = base_config;
    config.device_id = houseName(i);
    houses.emplace_back(std::make_shared<meshgossip::gossip::Gossip>(
        io_context,
        hub->createNode(config.device_id),
        std::make_shared<meshgossip::peer::InmemPeerSyncRepository>(),
        config));
  }
  for (size_t i = 0; i + 1 < *count; ++i) {
    hub->link(houseName(i), houseName(i + 1));
  }
  for (auto &house : houses) {
    house->start();
  }

  auto report = [&](std::string_view stage) {
    log->info("--- {}", stage);
    for (auto &house : houses) {
      auto stats = house->getQueueStats();
      log->info("{}: {} posts, {} peers, {} queued, {} dropped",
                house->deviceId(),
                stats.local_post_count,
                stats.peer_count,
                stats.queue_length,
                stats.dropped_count);
    }
  };

  meshgossip::coroSpawn(*io_context, [&]() -> meshgossip::Coro<void> {
    boost::asio::steady_timer timer{*io_context};
    auto sleep = [&](std::chrono::milliseconds delay) {
      timer.expires_after(delay);
      return timer.async_wait(boost::asio::use_awaitable);
    };
    // enough for a message to cross the street a few times
    std::chrono::milliseconds settle =
        base_config.inter_send_delay * 4 * static_cast<int>(*count) + 500ms;

    // houses post through the same factory the app would use
    auto post = [&](size_t house,
                    PostKind kind,
                    std::string_view item,
                    std::optional<SosCategory> category = std::nullopt) {
      auto made =
          meshgossip::gossip::makePost(kind,
                                       item,
                                       static_cast<uint32_t>(house + 1),
                                       base_config.post_limits,
                                       category);
      if (not made.has_value()) {
        log->error("{} post rejected: {}", item, made.error().message());
        return;
      }
      auto added = houses[house]->addLocalPost(made.value());
      if (not added.has_value()) {
        log->error("{} post rejected: {}", item, added.error().message());
        return;
      }
      log->info("{} posted {} as {}",
                houseName(house),
                item,
                made.value().id);
    };

    co_await sleep(200ms);
    post(0, PostKind::Sos, "Need water", SosCategory::Medical);
    co_await sleep(settle);
    report("after sos flood");

    auto middle = *count / 2;
    log->info("cutting link {} - {}", houseName(middle - 1), houseName(middle));
    hub->unlink(houseName(middle - 1), houseName(middle));
    co_await sleep(100ms);
    post(0, PostKind::Have, "Bread");
    post(*count - 1, PostKind::Want, "Batteries");
    co_await sleep(settle);
    report("while partitioned");

    log->info("restoring link {} - {}", houseName(middle - 1), houseName(middle));
    hub->link(houseName(middle - 1), houseName(middle));
    co_await sleep(settle);
    report("after heal");

    for (auto &house : houses) {
      house->stop();
    }
    co_await sleep(50ms);
    io_context->stop();
  });

  io_context->run();
  return EXIT_SUCCESS;
}
