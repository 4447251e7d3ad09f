/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <functional>

#include <meshgossip/codec/codec.hpp>
#include <meshgossip/gossip/gossip.hpp>
#include <meshgossip/peer/inmem_peer_sync_repository.hpp>
#include <meshgossip/transport/loopback_transport.hpp>

using meshgossip::PeerId;
using meshgossip::gossip::Config;
using meshgossip::gossip::Gossip;
using meshgossip::gossip::GossipError;
using meshgossip::gossip::GossipMessage;
using meshgossip::gossip::MessagePriority;
using meshgossip::gossip::MessageType;
using meshgossip::gossip::PostError;
using meshgossip::gossip::PostKind;
using meshgossip::gossip::SurvivalPost;
using meshgossip::peer::InmemPeerSyncRepository;
using meshgossip::transport::LoopbackHub;
using meshgossip::transport::LoopbackTransport;
using namespace std::chrono_literals;
namespace gossip = meshgossip::gossip;

class GossipTest : public ::testing::Test {
 protected:
  struct Node {
    std::shared_ptr<LoopbackTransport> transport;
    std::shared_ptr<Gossip> gossip;
  };

  static void SetUpTestSuite() {
    meshgossip::log::setLevelOfGroup(meshgossip::log::kDefaultGroupName,
                                     meshgossip::log::Level::WARN);
  }

  static Config fastConfig() {
    Config config;
    config.inter_send_delay = 0ms;
    config.retry_backoff = {1ms, 2ms, 3ms, 4ms};
    return config;
  }

  Node makeNode(const PeerId &id, Config config = fastConfig()) {
    auto transport = hub_->createNode(id);
    config.device_id = id;
    auto node = Node{
        transport,
        std::make_shared<Gossip>(io_context_,
                                 transport,
                                 std::make_shared<InmemPeerSyncRepository>(),
                                 config),
    };
    nodes_.emplace_back(node);
    return node;
  }

  static SurvivalPost post(PostKind kind, std::string id, std::string item) {
    return SurvivalPost{
        .kind = kind,
        .item = std::move(item),
        .house = 7,
        .timestamp = 1700000000,
        .id = std::move(id),
    };
  }

  static GossipMessage remoteMessage(std::vector<SurvivalPost> posts,
                                     uint32_t hop_count = 0,
                                     std::string sender = "remote",
                                     int64_t timestamp = 1700000000000) {
    auto message = gossip::makePostMessage(
        MessageType::PostList, posts, std::move(sender), timestamp);
    message.hop_count = hop_count;
    return message;
  }

  bool runUntil(const std::function<bool()> &done,
                std::chrono::milliseconds limit = 5s) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (not done()) {
      if (std::chrono::steady_clock::now() > deadline) {
        return false;
      }
      io_context_->restart();
      io_context_->run_for(1ms);
    }
    return true;
  }

  void TearDown() override {
    for (auto &node : nodes_) {
      node.gossip->stop();
    }
    io_context_->restart();
    io_context_->run_for(20ms);
  }

  std::shared_ptr<boost::asio::io_context> io_context_ =
      std::make_shared<boost::asio::io_context>();
  std::shared_ptr<LoopbackHub> hub_ =
      std::make_shared<LoopbackHub>(io_context_, 512);
  std::vector<Node> nodes_;
};

/**
 * @given a fresh node
 * @when a local sos post is added
 * @then it is stored and exactly one sos priority update is queued
 */
TEST_F(GossipTest, AddLocalSosPost) {
  auto node = makeNode("node-a");
  auto sos = post(PostKind::Sos, "sos0001", "Need water");
  ASSERT_TRUE(node.gossip->addLocalPost(sos).has_value());

  EXPECT_EQ(node.gossip->getLocalPosts(), std::vector<SurvivalPost>{sos});
  EXPECT_EQ(node.gossip->getQueueStats().queue_length, 1);
  EXPECT_EQ(node.gossip->getQueueStats().local_post_count, 1);
  auto pending = node.gossip->pendingEntries();
  ASSERT_EQ(pending.size(), 1);
  EXPECT_EQ(pending[0].priority, MessagePriority::Sos);
  EXPECT_EQ(pending[0].message.type, MessageType::PostUpdate);
  EXPECT_EQ(pending[0].message.hop_count, 0);
  EXPECT_EQ(pending[0].message.sender_id, "node-a");
  EXPECT_EQ(pending[0].message.payload.at(0).at("id"), "sos0001");
  EXPECT_FALSE(pending[0].target.has_value());
}

TEST_F(GossipTest, InvalidLocalPostIsRejected) {
  auto node = makeNode("node-a");
  auto r = node.gossip->addLocalPost(post(PostKind::Have, "have001", ""));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), PostError::EMPTY_DESCRIPTION);
  r = node.gossip->addLocalPost(post(PostKind::Have, "h1", "Bread"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), PostError::BAD_ID_LENGTH);
  EXPECT_TRUE(node.gossip->getLocalPosts().empty());
  EXPECT_EQ(node.gossip->getQueueStats().queue_length, 0);
}

/**
 * @given posts that serialize past the per-post byte bound
 * @when one is added locally and another arrives from a peer
 * @then the local add fails and the remote entry is skipped, not re-flooded
 */
TEST_F(GossipTest, OversizedPostsAreRejected) {
  auto node = makeNode("node-a");
  auto bloated = post(PostKind::Have, "have001", "Bread");
  bloated.responders = std::vector<std::string>(500, "12345");

  auto r = node.gossip->addLocalPost(bloated);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), PostError::TOO_LARGE);
  EXPECT_TRUE(node.gossip->getLocalPosts().empty());
  EXPECT_EQ(node.gossip->getQueueStats().queue_length, 0);

  auto message =
      remoteMessage({bloated, post(PostKind::Want, "want001", "Rope")});
  auto fresh = node.gossip->receiveMessage(message, "peer-x");
  ASSERT_EQ(fresh.size(), 1);
  EXPECT_EQ(fresh[0].id, "want001");
  auto pending = node.gossip->pendingEntries();
  ASSERT_EQ(pending.size(), 1);
  // forwarded unchanged, the receiver of the forward skips the entry again
  EXPECT_EQ(pending[0].priority, MessagePriority::Want);
  EXPECT_EQ(pending[0].message.hop_count, 1);

  auto only_bloated = remoteMessage({bloated}, 0, "other");
  EXPECT_TRUE(node.gossip->receiveMessage(only_bloated, "peer-x").empty());
  EXPECT_EQ(node.gossip->getQueueStats().queue_length, 1);
  EXPECT_EQ(node.gossip->getLocalPosts().size(), 1);
}

TEST_F(GossipTest, QueueOrderFollowsPostPriority) {
  auto node = makeNode("node-a");
  ASSERT_TRUE(
      node.gossip->addLocalPost(post(PostKind::Have, "have001", "Bread"))
          .has_value());
  ASSERT_TRUE(
      node.gossip->addLocalPost(post(PostKind::Want, "want001", "Batteries"))
          .has_value());
  ASSERT_TRUE(
      node.gossip->addLocalPost(post(PostKind::Sos, "sos0001", "Need water"))
          .has_value());
  auto pending = node.gossip->pendingEntries();
  ASSERT_EQ(pending.size(), 3);
  EXPECT_EQ(pending[0].priority, MessagePriority::Sos);
  EXPECT_EQ(pending[1].priority, MessagePriority::Want);
  EXPECT_EQ(pending[2].priority, MessagePriority::Have);
  // origination timestamps never repeat
  EXPECT_NE(pending[0].message.timestamp, pending[1].message.timestamp);
  EXPECT_NE(pending[1].message.timestamp, pending[2].message.timestamp);
}

TEST_F(GossipTest, UpdateAndRemoveLocalPost) {
  auto node = makeNode("node-a");
  auto sos = post(PostKind::Sos, "sos0001", "Need water");
  EXPECT_EQ(node.gossip->updateLocalPost(sos).error(),
            GossipError::UNKNOWN_POST);
  ASSERT_TRUE(node.gossip->addLocalPost(sos).has_value());
  sos.resolved = true;
  sos.responders = std::vector<std::string>{"9"};
  ASSERT_TRUE(node.gossip->updateLocalPost(sos).has_value());
  EXPECT_EQ(node.gossip->getLocalPosts(), std::vector<SurvivalPost>{sos});
  EXPECT_EQ(node.gossip->getQueueStats().queue_length, 2);

  EXPECT_TRUE(node.gossip->removeLocalPost("sos0001"));
  EXPECT_FALSE(node.gossip->removeLocalPost("sos0001"));
  EXPECT_TRUE(node.gossip->getLocalPosts().empty());
}

TEST_F(GossipTest, BroadcastLocalPosts) {
  auto node = makeNode("node-a");
  node.gossip->broadcastLocalPosts();
  EXPECT_EQ(node.gossip->getQueueStats().queue_length, 0);

  ASSERT_TRUE(
      node.gossip->addLocalPost(post(PostKind::Have, "have001", "Bread"))
          .has_value());
  ASSERT_TRUE(
      node.gossip->addLocalPost(post(PostKind::Want, "want001", "Batteries"))
          .has_value());
  node.gossip->broadcastLocalPosts();
  auto pending = node.gossip->pendingEntries();
  ASSERT_EQ(pending.size(), 3);
  auto &list = pending[1];
  EXPECT_EQ(list.message.type, MessageType::PostList);
  EXPECT_EQ(list.priority, MessagePriority::Want);
  ASSERT_EQ(list.message.payload.size(), 2);
  EXPECT_EQ(list.message.payload.at(0).at("id"), "want001");
  EXPECT_EQ(list.message.payload.at(1).at("id"), "have001");
}

TEST_F(GossipTest, PartitionHealQueuesOneBroadcast) {
  auto node = makeNode("node-a");
  ASSERT_TRUE(
      node.gossip->addLocalPost(post(PostKind::Have, "have001", "Bread"))
          .has_value());
  auto before = node.gossip->getQueueStats().queue_length;
  node.gossip->handlePartitionHeal("node-b");
  EXPECT_EQ(node.gossip->getQueueStats().queue_length, before + 1);
}

TEST_F(GossipTest, DuplicateMessageYieldsNothing) {
  auto node = makeNode("node-a");
  auto message = remoteMessage({post(PostKind::Have, "have001", "Bread")});
  auto first = node.gossip->receiveMessage(message, "peer-x");
  ASSERT_EQ(first.size(), 1);
  EXPECT_EQ(first[0].id, "have001");
  EXPECT_TRUE(node.gossip->receiveMessage(message, "peer-x").empty());
  EXPECT_TRUE(node.gossip->receiveMessage(message, "peer-y").empty());

  auto pending = node.gossip->pendingEntries();
  ASSERT_EQ(pending.size(), 1);
  EXPECT_EQ(pending[0].message.hop_count, 1);
  EXPECT_EQ(pending[0].message.sender_id, "remote");
  EXPECT_EQ(pending[0].message.timestamp, message.timestamp);
}

TEST_F(GossipTest, HopLimit) {
  auto node = makeNode("node-a");
  auto at_limit = remoteMessage(
      {post(PostKind::Have, "have001", "Bread")}, 5, "remote", 1);
  EXPECT_TRUE(node.gossip->receiveMessage(at_limit, "peer-x").empty());
  EXPECT_FALSE(node.gossip->getPeerSyncStatus("peer-x").has_value());

  auto below = remoteMessage(
      {post(PostKind::Have, "have001", "Bread")}, 4, "remote", 2);
  EXPECT_EQ(node.gossip->receiveMessage(below, "peer-x").size(), 1);
  auto pending = node.gossip->pendingEntries();
  ASSERT_EQ(pending.size(), 1);
  EXPECT_EQ(pending[0].message.hop_count, 5);
}

TEST_F(GossipTest, InvalidEntriesAreSkippedIndividually) {
  auto node = makeNode("node-a");
  auto message = remoteMessage({post(PostKind::Have, "have001", "Bread")});
  message.payload.push_back(nlohmann::json{{"t", "x"}});
  message.payload.push_back(nlohmann::json{
      {"t", "w"}, {"i", ""}, {"h", 3}, {"ts", 1}, {"id", "want001"}});
  message.payload.push_back(
      nlohmann::json(post(PostKind::Want, "want002", "Candles")));
  auto fresh = node.gossip->receiveMessage(message, "peer-x");
  ASSERT_EQ(fresh.size(), 2);
  EXPECT_EQ(fresh[0].id, "have001");
  EXPECT_EQ(fresh[1].id, "want002");
  // forwarded at the most urgent new post
  EXPECT_EQ(node.gossip->pendingEntries().at(0).priority,
            MessagePriority::Want);
}

TEST_F(GossipTest, KnownPostsAreNotNew) {
  auto node = makeNode("node-a");
  ASSERT_TRUE(
      node.gossip->addLocalPost(post(PostKind::Sos, "sos0001", "Need water"))
          .has_value());
  auto message = remoteMessage({post(PostKind::Sos, "sos0001", "Need water"),
                                post(PostKind::Have, "have001", "Bread")});
  auto fresh = node.gossip->receiveMessage(message, "peer-x");
  ASSERT_EQ(fresh.size(), 1);
  EXPECT_EQ(fresh[0].id, "have001");
  auto pending = node.gossip->pendingEntries();
  ASSERT_EQ(pending.size(), 2);
  EXPECT_EQ(pending[1].priority, MessagePriority::Have);
  EXPECT_EQ(pending[1].message.hop_count, 1);

  // nothing new: peer still accounted, nothing forwarded
  auto repeat =
      remoteMessage({post(PostKind::Have, "have001", "Bread")}, 0, "other");
  EXPECT_TRUE(node.gossip->receiveMessage(repeat, "peer-x").empty());
  EXPECT_EQ(node.gossip->getQueueStats().queue_length, 2);
  EXPECT_EQ(node.gossip->getPeerSyncStatus("peer-x")->message_count, 2);
}

TEST_F(GossipTest, PeerSyncStatus) {
  auto node = makeNode("node-a");
  EXPECT_TRUE(node.gossip->getPeerSyncStatus().empty());
  node.gossip->receiveMessage(
      remoteMessage({post(PostKind::Have, "have001", "Bread")}), "peer-x");
  auto status = node.gossip->getPeerSyncStatus("peer-x");
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->message_count, 1);
  EXPECT_TRUE(status->is_connected);
  EXPECT_GT(status->last_sync_time, 0);
  EXPECT_EQ(node.gossip->getQueueStats().peer_count, 1);
  EXPECT_EQ(node.gossip->getQueueStats().seen_message_count, 1);
}

TEST_F(GossipTest, AcksAreUnicastAndNeverForwarded) {
  auto config = fastConfig();
  config.send_acks = true;
  auto node = makeNode("node-a", config);
  node.gossip->receiveMessage(
      remoteMessage({post(PostKind::Have, "have001", "Bread")}), "peer-x");
  auto pending = node.gossip->pendingEntries();
  ASSERT_EQ(pending.size(), 2);
  auto &ack = pending[1];
  EXPECT_EQ(ack.priority, MessagePriority::Ack);
  EXPECT_EQ(ack.message.type, MessageType::Ack);
  EXPECT_EQ(ack.target, PeerId{"peer-x"});
  EXPECT_EQ(ack.message.payload, nlohmann::json::array({"have001"}));

  GossipMessage incoming_ack{
      .type = MessageType::Ack,
      .payload = nlohmann::json::array({"sos0001"}),
      .timestamp = 5,
      .sender_id = "peer-y",
  };
  EXPECT_TRUE(node.gossip->receiveMessage(incoming_ack, "peer-y").empty());
  EXPECT_EQ(node.gossip->getQueueStats().queue_length, 2);
  EXPECT_EQ(node.gossip->getPeerSyncStatus("peer-y")->message_count, 1);
}

TEST_F(GossipTest, FramePayloads) {
  auto node = makeNode("node-a");
  auto small = remoteMessage({post(PostKind::Have, "have001", "Bread")});
  auto framed = node.gossip->framePayloads(small);
  ASSERT_TRUE(framed.has_value());
  ASSERT_EQ(framed.value().size(), 1);
  EXPECT_EQ(framed.value()[0], gossip::encodeMessage(small));

  std::vector<SurvivalPost> posts;
  for (int i = 0; i < 20; ++i) {
    posts.emplace_back(post(PostKind::Want,
                            "want" + std::to_string(100 + i),
                            "Item number " + std::to_string(i * 7919)
                                + " needed urgently by the family"));
  }
  auto big = remoteMessage(posts);
  ASSERT_GT(gossip::encodeMessage(big).size(), 512);
  framed = node.gossip->framePayloads(big);
  ASSERT_TRUE(framed.has_value());
  for (auto &payload : framed.value()) {
    EXPECT_LE(payload.size(), 512);
  }

  // another node rebuilds it from the chunks in reverse order
  auto other = makeNode("node-b");
  auto payloads = framed.value();
  std::reverse(payloads.begin(), payloads.end());
  for (auto &payload : payloads) {
    other.gossip->onPayload("node-a", payload);
  }
  EXPECT_EQ(other.gossip->getLocalPosts().size(), 20);
  EXPECT_EQ(other.gossip->getQueueStats().partial_reassembly_count, 0);
}

/**
 * @given a receiver whose message bound lies between the compressed and the
 * inflated size of a chunked message
 * @when the chunks arrive
 * @then inflation stops at the bound and nothing is merged
 */
TEST_F(GossipTest, InflatedMessagesAreBounded) {
  auto sender = makeNode("node-a");
  std::vector<SurvivalPost> posts;
  for (int i = 0; i < 20; ++i) {
    posts.emplace_back(post(PostKind::Have,
                            "have" + std::to_string(100 + i),
                            "Spare blankets and canned food, house block "
                                + std::to_string(i)));
  }
  auto big = remoteMessage(posts);
  auto encoded = gossip::encodeMessage(big);
  auto compressed = meshgossip::codec::compress(encoded);
  ASSERT_TRUE(compressed.has_value());
  ASSERT_LT(compressed.value().size(), encoded.size());

  auto config = fastConfig();
  config.max_message_bytes =
      (compressed.value().size() + encoded.size()) / 2;
  auto receiver = makeNode("node-b", config);

  auto framed = sender.gossip->framePayloads(big);
  ASSERT_TRUE(framed.has_value());
  ASSERT_GT(framed.value().size(), 1);
  for (auto &payload : framed.value()) {
    receiver.gossip->onPayload("node-a", payload);
  }
  EXPECT_TRUE(receiver.gossip->getLocalPosts().empty());
  EXPECT_EQ(receiver.gossip->getQueueStats().partial_reassembly_count, 0);

  // with the default bound the same chunks go through
  auto roomy = makeNode("node-c");
  for (auto &payload : framed.value()) {
    roomy.gossip->onPayload("node-a", payload);
  }
  EXPECT_EQ(roomy.gossip->getLocalPosts().size(), 20);
}

TEST_F(GossipTest, OversizedOutboundMessageIsNotFramed) {
  auto config = fastConfig();
  config.max_message_bytes = 600;
  auto node = makeNode("node-a", config);
  std::vector<SurvivalPost> posts;
  for (int i = 0; i < 10; ++i) {
    posts.emplace_back(post(
        PostKind::Want, "want" + std::to_string(100 + i), "Batteries"));
  }
  auto framed = node.gossip->framePayloads(remoteMessage(posts));
  ASSERT_FALSE(framed.has_value());
  EXPECT_EQ(framed.error(), GossipError::MESSAGE_TOO_LARGE);
}

TEST_F(GossipTest, GarbagePayloadsAreDropped) {
  auto node = makeNode("node-a");
  node.gossip->onPayload("peer-x", "not json");
  node.gossip->onPayload("peer-x", R"({"hello":"world"})");
  node.gossip->onPayload("peer-x", R"({"messageId":"m","chunkIndex":0})");
  node.gossip->onPayload(
      "peer-x",
      R"({"messageId":"m","chunkIndex":0,"totalChunks":1,"data":"%%%","checksum":"x"})");
  EXPECT_TRUE(node.gossip->getLocalPosts().empty());
  EXPECT_FALSE(node.gossip->getPeerSyncStatus("peer-x").has_value());
}

/**
 * @given a transport that fails every send and short backoffs
 * @when a post is queued
 * @then the message is tried once plus once per backoff step, then dropped
 */
TEST_F(GossipTest, AlwaysFailingTransportDrainsQueue) {
  auto node = makeNode("node-a");
  node.transport->setFailSends(true);
  node.gossip->start();
  ASSERT_TRUE(
      node.gossip->addLocalPost(post(PostKind::Sos, "sos0001", "Need water"))
          .has_value());
  ASSERT_TRUE(runUntil([&] {
    auto stats = node.gossip->getQueueStats();
    return stats.dropped_count == 1 and stats.queue_length == 0
       and stats.pending_retries == 0 and not stats.is_processing;
  }));
  EXPECT_EQ(node.transport->sendAttempts(),
            node.gossip->config().retry_backoff.size() + 1);
  EXPECT_TRUE(node.transport->sent().empty());
}

TEST_F(GossipTest, RecoversWhenTransportComesBack) {
  auto config = fastConfig();
  config.retry_backoff = {20ms, 20ms, 20ms, 20ms};
  auto node = makeNode("node-a", config);
  auto peer = makeNode("node-b");
  hub_->link("node-a", "node-b");
  node.gossip->start();
  peer.gossip->start();
  node.transport->setFailSends(true);
  ASSERT_TRUE(
      node.gossip->addLocalPost(post(PostKind::Sos, "sos0001", "Need water"))
          .has_value());
  ASSERT_TRUE(
      runUntil([&] { return node.transport->sendAttempts() >= 2; }));
  node.transport->setFailSends(false);
  ASSERT_TRUE(
      runUntil([&] { return peer.gossip->getLocalPosts().size() == 1; }));
  EXPECT_EQ(node.gossip->getQueueStats().dropped_count, 0);
}

/**
 * @given four nodes in a line a-b-c-d
 * @when a posts an sos
 * @then it floods hop by hop to d
 */
TEST_F(GossipTest, FloodsOverLoopbackMesh) {
  std::vector<Node> line;
  for (auto id : {"a", "b", "c", "d"}) {
    line.emplace_back(makeNode(id));
  }
  hub_->link("a", "b");
  hub_->link("b", "c");
  hub_->link("c", "d");
  for (auto &node : line) {
    node.gossip->start();
  }
  ASSERT_TRUE(runUntil([&] {
    return line[1].gossip->getPeerSyncStatus().size() == 2
       and line[3].gossip->getPeerSyncStatus().size() == 1;
  }));

  auto sos = post(PostKind::Sos, "sos0001", "Need water");
  ASSERT_TRUE(line[0].gossip->addLocalPost(sos).has_value());
  ASSERT_TRUE(runUntil([&] {
    return line[3].gossip->getLocalPosts() == std::vector<SurvivalPost>{sos};
  }));
  auto from_c = line[3].gossip->getPeerSyncStatus("c");
  ASSERT_TRUE(from_c.has_value());
  EXPECT_GE(from_c->message_count, 1);

  // settles: every queue drains, nothing dropped
  ASSERT_TRUE(runUntil([&] {
    return std::ranges::all_of(line, [](const Node &node) {
      auto stats = node.gossip->getQueueStats();
      return stats.queue_length == 0 and not stats.is_processing;
    });
  }));
  for (auto &node : line) {
    EXPECT_EQ(node.gossip->getQueueStats().dropped_count, 0);
  }
}

/**
 * @given two nodes that learned of each other and then lost the link
 * @when they come back in range
 * @then both resync posts made while apart
 */
TEST_F(GossipTest, PartitionHealOverLoopback) {
  auto a = makeNode("a");
  auto b = makeNode("b");
  hub_->link("a", "b");
  a.gossip->start();
  b.gossip->start();
  ASSERT_TRUE(runUntil([&] {
    return a.gossip->getPeerSyncStatus("b").has_value()
       and b.gossip->getPeerSyncStatus("a").has_value();
  }));

  hub_->unlink("a", "b");
  ASSERT_TRUE(runUntil([&] {
    return not a.gossip->getPeerSyncStatus("b")->is_connected
       and not b.gossip->getPeerSyncStatus("a")->is_connected;
  }));
  ASSERT_TRUE(
      a.gossip->addLocalPost(post(PostKind::Want, "want001", "Batteries"))
          .has_value());
  ASSERT_TRUE(b.gossip->addLocalPost(post(PostKind::Have, "have001", "Bread"))
                  .has_value());
  ASSERT_TRUE(runUntil([&] {
    return a.gossip->getQueueStats().queue_length == 0
       and b.gossip->getQueueStats().queue_length == 0;
  }));
  EXPECT_EQ(a.gossip->getLocalPosts().size(), 1);

  hub_->link("a", "b");
  ASSERT_TRUE(runUntil([&] {
    return a.gossip->getLocalPosts().size() == 2
       and b.gossip->getLocalPosts().size() == 2;
  }));
  EXPECT_TRUE(a.gossip->getPeerSyncStatus("b")->is_connected);
}

TEST_F(GossipTest, StopCancelsRetries) {
  auto config = fastConfig();
  config.retry_backoff = {10s};
  auto node = makeNode("node-a", config);
  node.transport->setFailSends(true);
  node.gossip->start();
  ASSERT_TRUE(
      node.gossip->addLocalPost(post(PostKind::Have, "have001", "Bread"))
          .has_value());
  ASSERT_TRUE(runUntil(
      [&] { return node.gossip->getQueueStats().pending_retries == 1; }));
  node.gossip->stop();
  EXPECT_EQ(node.gossip->getQueueStats().pending_retries, 0);
  ASSERT_TRUE(runUntil([&] {
    return not node.gossip->getQueueStats().is_processing
       and not node.transport->started();
  }));
  EXPECT_EQ(node.transport->sendAttempts(), 1);
}
