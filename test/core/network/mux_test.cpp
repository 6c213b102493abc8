/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/mux.hpp"

#include <gtest/gtest.h>

#include "crypto/sha/sha256.hpp"
#include "mock/core/network/connection_mock.hpp"
#include "network/impl/memory_connection.hpp"
#include "scale/scale.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/run_coro.hpp"

using namespace slashtags;
using namespace slashtags::network;
using common::Buffer;
using common::BufferView;
using testing::_;
using testing::Return;

class MuxTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    std::tie(alice, bob) = MemoryConnection::makePair(
        io, PublicKey{crypto::sha256("alice")}, PublicKey{crypto::sha256("bob")});
    alice_mux = Mux::from(alice);
    bob_mux = Mux::from(bob);
  }

  /// channel which records received messages
  std::shared_ptr<Channel> makeChannel(const std::shared_ptr<Mux> &mux,
                                       std::vector<Buffer> &received) {
    EXPECT_OUTCOME_TRUE(channel, mux->createChannel(kProtocol));
    channel->onMessage([&received](BufferView message) {
      received.emplace_back(message.begin(), message.end());
    });
    return channel;
  }

  static inline const ProtocolName kProtocol = "chat";

  boost::asio::io_context io;
  std::shared_ptr<MemoryConnection> alice;
  std::shared_ptr<MemoryConnection> bob;
  std::shared_ptr<Mux> alice_mux;
  std::shared_ptr<Mux> bob_mux;
};

/**
 * @given connection
 * @when get its multiplexer twice
 * @then the same instance is returned
 */
TEST_F(MuxTest, OnePerConnection) {
  EXPECT_EQ(Mux::from(alice), alice_mux);
  EXPECT_EQ(alice_mux->connection(), alice);
}

/**
 * @given channels of the same protocol on both sides
 * @when both open and exchange messages
 * @then open is observed by both sides and messages arrive in order
 */
TEST_F(MuxTest, OpenAndExchange) {
  std::vector<Buffer> alice_received, bob_received;
  auto a = makeChannel(alice_mux, alice_received);
  auto b = makeChannel(bob_mux, bob_received);
  int opened = 0;
  a->onOpen([&] { ++opened; });
  b->onOpen([&] { ++opened; });

  EXPECT_EC(a->send(Buffer{0}), MuxError::CHANNEL_NOT_OPENED);
  EXPECT_OUTCOME_TRUE_1(a->open());
  EXPECT_OUTCOME_TRUE_1(b->open());
  testutil::runReady(io);
  EXPECT_EQ(opened, 2);
  EXPECT_TRUE(a->isOpen());
  EXPECT_TRUE(b->isOpen());

  EXPECT_OUTCOME_TRUE_1(a->send(Buffer{1}));
  EXPECT_OUTCOME_TRUE_1(a->send(Buffer{2}));
  EXPECT_OUTCOME_TRUE_1(b->send(Buffer{3}));
  testutil::runReady(io);
  EXPECT_EQ(bob_received, (std::vector<Buffer>{{1}, {2}}));
  EXPECT_EQ(alice_received, (std::vector<Buffer>{{3}}));
}

/**
 * @given alice opened the channel and sent messages
 * @when bob creates and opens his channel only afterwards
 * @then bob receives the messages sent before
 */
TEST_F(MuxTest, EarlyMessagesAreKept) {
  std::vector<Buffer> alice_received, bob_received;
  auto a = makeChannel(alice_mux, alice_received);
  EXPECT_OUTCOME_TRUE_1(a->open());
  EXPECT_OUTCOME_TRUE_1(a->send(Buffer{42}));
  testutil::runReady(io);
  EXPECT_TRUE(bob_mux->remoteOpened(kProtocol));

  auto b = makeChannel(bob_mux, bob_received);
  EXPECT_OUTCOME_TRUE_1(b->open());
  EXPECT_TRUE(b->isOpen());
  EXPECT_EQ(bob_received, (std::vector<Buffer>{{42}}));
}

/**
 * @given channel already created for a protocol
 * @when create another one for the same protocol
 * @then CHANNEL_EXISTS is returned until the first one is closed
 */
TEST_F(MuxTest, ChannelExists) {
  EXPECT_OUTCOME_TRUE(channel, alice_mux->createChannel(kProtocol));
  EXPECT_EC(alice_mux->createChannel(kProtocol), MuxError::CHANNEL_EXISTS);
  channel->close();
  EXPECT_OUTCOME_TRUE_1(alice_mux->createChannel(kProtocol));
}

/**
 * @given opened channels
 * @when alice closes hers
 * @then bob observes close and sending fails on both sides
 */
TEST_F(MuxTest, CloseChannel) {
  std::vector<Buffer> alice_received, bob_received;
  auto a = makeChannel(alice_mux, alice_received);
  auto b = makeChannel(bob_mux, bob_received);
  bool bob_closed = false;
  b->onClose([&] { bob_closed = true; });
  EXPECT_OUTCOME_TRUE_1(a->open());
  EXPECT_OUTCOME_TRUE_1(b->open());
  testutil::runReady(io);

  a->close();
  EXPECT_EC(a->send(Buffer{1}), MuxError::CHANNEL_CLOSED);
  testutil::runReady(io);
  EXPECT_TRUE(bob_closed);
  EXPECT_TRUE(b->isClosed());
  EXPECT_EQ(bob_mux->channel(kProtocol), nullptr);
}

/**
 * @given opened channels
 * @when the connection closes
 * @then every channel is closed and no new channel can be created
 */
TEST_F(MuxTest, ConnectionClose) {
  std::vector<Buffer> alice_received, bob_received;
  auto a = makeChannel(alice_mux, alice_received);
  auto b = makeChannel(bob_mux, bob_received);
  EXPECT_OUTCOME_TRUE_1(a->open());
  EXPECT_OUTCOME_TRUE_1(b->open());
  testutil::runReady(io);

  alice->close();
  testutil::runReady(io);
  EXPECT_TRUE(a->isClosed());
  EXPECT_TRUE(b->isClosed());
  EXPECT_TRUE(bob->isClosed());
  EXPECT_EC(bob_mux->createChannel(kProtocol), MuxError::CONNECTION_CLOSED);
}

/**
 * @given multiplexer over a mocked connection
 * @when a frame which is not a mux frame arrives
 * @then the connection is destroyed with the decode error
 */
TEST_F(MuxTest, MalformedFrame) {
  auto connection = std::make_shared<ConnectionMock>();
  auto mux = Mux::from(connection);
  EXPECT_CALL(*connection, onDestroy(_)).Times(1);
  connection->receive(Buffer{7, 7, 7});
  EXPECT_TRUE(connection->isClosed());
}

/**
 * @given multiplexer over a mocked connection
 * @when remote side floods a protocol which is never opened locally
 * @then frames are kept up to the limit, then the connection is destroyed
 */
TEST_F(MuxTest, PendingLimit) {
  auto connection = std::make_shared<ConnectionMock>();
  auto mux = Mux::from(connection);
  EXPECT_OUTCOME_TRUE(
      open, scale::encode(MuxFrame{MuxFrame::Type::OPEN, "unregistered", {}}));
  EXPECT_OUTCOME_TRUE(message,
                      scale::encode(MuxFrame{MuxFrame::Type::MESSAGE,
                                             "unregistered",
                                             Buffer(1024, 1)}));

  EXPECT_CALL(*connection, onDestroy(_)).Times(0);
  connection->receive(open);
  for (size_t i = 1; i < Mux::kMaxPendingFrames; ++i) {
    connection->receive(message);
  }
  EXPECT_FALSE(connection->isClosed());
  EXPECT_TRUE(mux->remoteOpened("unregistered"));
  testing::Mock::VerifyAndClearExpectations(connection.get());

  EXPECT_CALL(*connection,
              onDestroy(std::error_code{MuxError::PENDING_LIMIT_EXCEEDED}))
      .Times(1);
  for (size_t i = 0; i < 10000; ++i) {
    connection->receive(message);
  }
  EXPECT_TRUE(connection->isClosed());
  EXPECT_FALSE(mux->remoteOpened("unregistered"));
  EXPECT_EC(mux->createChannel("unregistered"), MuxError::CONNECTION_CLOSED);
}

/**
 * @given multiplexer over a mocked connection
 * @when remote side opens too many protocols which are not opened locally
 * @then the connection is destroyed
 */
TEST_F(MuxTest, PendingProtocolsLimit) {
  auto connection = std::make_shared<ConnectionMock>();
  auto mux = Mux::from(connection);
  EXPECT_CALL(*connection,
              onDestroy(std::error_code{MuxError::PENDING_LIMIT_EXCEEDED}))
      .Times(1);
  for (size_t i = 0; i <= Mux::kMaxPendingProtocols; ++i) {
    EXPECT_OUTCOME_TRUE(
        open,
        scale::encode(MuxFrame{
            MuxFrame::Type::OPEN, "protocol-" + std::to_string(i), {}}));
    connection->receive(open);
  }
  EXPECT_TRUE(connection->isClosed());
}

/**
 * @given multiplexer over a mocked connection
 * @when channel is opened
 * @then OPEN frame of the protocol is written to the connection
 */
TEST_F(MuxTest, OpenFrameWritten) {
  auto connection = std::make_shared<ConnectionMock>();
  auto mux = Mux::from(connection);
  EXPECT_OUTCOME_TRUE(expected,
                      scale::encode(MuxFrame{MuxFrame::Type::OPEN, "chat", {}}));
  EXPECT_CALL(*connection, write(expected))
      .WillOnce(Return(outcome::success()));
  EXPECT_OUTCOME_TRUE(channel, mux->createChannel("chat"));
  EXPECT_OUTCOME_TRUE_1(channel->open());
  EXPECT_FALSE(channel->isOpen());
}
