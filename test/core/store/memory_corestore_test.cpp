/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "store/impl/memory_corestore.hpp"

#include <gtest/gtest.h>

#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "crypto/sha/sha256.hpp"
#include "mock/core/network/connection_mock.hpp"
#include "network/impl/memory_connection.hpp"
#include "network/mux.hpp"
#include "scale/scale.hpp"
#include "store/impl/replication_messages.hpp"
#include "store/impl/replicator.hpp"
#include "store/store_error.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/run_coro.hpp"

using namespace slashtags;
using namespace slashtags::store;
using common::Buffer;
using common::str2byte;
using namespace std::chrono_literals;
using testing::_;
using testing::Return;

class MemoryCorestoreTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    options.update_timeout = 1s;
    alice = std::make_shared<MemoryCorestore>(
        provider, crypto::sha256("alice"), options);
    bob = std::make_shared<MemoryCorestore>(
        provider, crypto::sha256("bob"), options);
  }

  /// links both stores by an in-memory connection
  void connect() {
    auto [a, b] = network::MemoryConnection::makePair(
        io,
        network::PublicKey{crypto::sha256("a")},
        network::PublicKey{crypto::sha256("b")});
    alice_connection = a;
    bob_connection = b;
    alice->replicate(alice_connection);
    bob->replicate(bob_connection);
    testutil::runReady(io);
  }

  boost::asio::io_context io;
  std::shared_ptr<crypto::Ed25519Provider> provider =
      std::make_shared<crypto::Ed25519ProviderImpl>();
  CorestoreOptions options;
  std::shared_ptr<MemoryCorestore> alice;
  std::shared_ptr<MemoryCorestore> bob;
  std::shared_ptr<network::Connection> alice_connection;
  std::shared_ptr<network::Connection> bob_connection;
};

/**
 * @given store
 * @when get named cores
 * @then the same name gives the same writable core, other names and
 * namespaces give other keys
 */
TEST_F(MemoryCorestoreTest, NamedCores) {
  EXPECT_OUTCOME_TRUE(first, alice->get({.name = "drive"}));
  EXPECT_OUTCOME_TRUE(second, alice->get({.name = "drive"}));
  EXPECT_OUTCOME_TRUE(other, alice->get({.name = "other"}));
  EXPECT_EQ(first, second);
  EXPECT_TRUE(first->writable());
  EXPECT_NE(first->key(), other->key());

  auto ns = alice->namespaced(str2byte("ns"));
  EXPECT_OUTCOME_TRUE(namespaced, ns->get({.name = "drive"}));
  EXPECT_NE(namespaced->key(), first->key());

  // namespaces of the same name are the same
  EXPECT_OUTCOME_TRUE(again,
                      alice->namespaced(str2byte("ns"))->get({.name = "drive"}));
  EXPECT_EQ(again->key(), namespaced->key());
}

/**
 * @given store
 * @when get a core by key pair and by the public key of it
 * @then both give the same writable core
 */
TEST_F(MemoryCorestoreTest, KeyPairWins) {
  EXPECT_OUTCOME_TRUE(kp, provider->generateKeypair());
  EXPECT_OUTCOME_TRUE(replica, alice->get({.key = kp.public_key}));
  EXPECT_FALSE(replica->writable());

  EXPECT_OUTCOME_TRUE(writer, alice->get({.key_pair = kp}));
  EXPECT_EQ(writer, replica);
  EXPECT_TRUE(replica->writable());
  EXPECT_EQ(replica->discoveryKey(), crypto::discoveryKey(kp.public_key));
}

/**
 * @given store
 * @when get core without any key, then close the store and get again
 * @then MISSING_KEY, then CLOSED are returned and opened cores are closed
 */
TEST_F(MemoryCorestoreTest, Errors) {
  EXPECT_EC(alice->get({}), StoreError::MISSING_KEY);

  EXPECT_OUTCOME_TRUE(core, alice->get({.name = "a"}));
  testutil::runCoro(io, alice->close());
  EXPECT_TRUE(alice->closed());
  EXPECT_TRUE(core->closed());
  EXPECT_EC(alice->get({.name = "a"}), StoreError::CLOSED);
  EXPECT_EC(core->append(str2byte("x")), StoreError::CLOSED);
}

/**
 * @given core opened by two namespaces of the same root
 * @when one of them closes
 * @then the core stays open until the other closes too
 */
TEST_F(MemoryCorestoreTest, SharedCoreRefCount) {
  EXPECT_OUTCOME_TRUE(kp, provider->generateKeypair());
  auto ns1 = alice->namespaced(str2byte("1"));
  auto ns2 = alice->namespaced(str2byte("2"));
  EXPECT_OUTCOME_TRUE(core1, ns1->get({.key_pair = kp}));
  EXPECT_OUTCOME_TRUE(core2, ns2->get({.key = kp.public_key}));
  EXPECT_EQ(core1, core2);

  testutil::runCoro(io, ns1->close());
  EXPECT_FALSE(core2->closed());
  testutil::runCoro(io, ns2->close());
  EXPECT_TRUE(core2->closed());
}

/**
 * @given store
 * @when resolve keys of cores and then open them
 * @then keys match the opened cores and nothing is opened by resolving
 */
TEST_F(MemoryCorestoreTest, ResolveKey) {
  EXPECT_OUTCOME_TRUE(kp, provider->generateKeypair());
  EXPECT_OUTCOME_TRUE(named, alice->resolveKey({.name = "drive"}));
  EXPECT_OUTCOME_TRUE(by_pair, alice->resolveKey({.key_pair = kp}));
  EXPECT_OUTCOME_TRUE(by_key, alice->resolveKey({.key = kp.public_key}));
  EXPECT_EC(alice->resolveKey({}), StoreError::MISSING_KEY);
  EXPECT_EQ(by_pair, kp.public_key);
  EXPECT_EQ(by_key, kp.public_key);
  EXPECT_EQ(alice->opened(), 0u);

  EXPECT_OUTCOME_TRUE(core, alice->get({.name = "drive"}));
  EXPECT_EQ(core->key(), named);
  EXPECT_EQ(alice->opened(), 1u);
}

/**
 * @given core opened twice through the same store
 * @when release it twice
 * @then the core closes with the last release, extra releases are ignored
 */
TEST_F(MemoryCorestoreTest, Release) {
  EXPECT_OUTCOME_TRUE(first, alice->get({.name = "drive"}));
  EXPECT_OUTCOME_TRUE(second, alice->get({.name = "drive"}));
  EXPECT_EQ(alice->opened(), 2u);

  alice->release(first);
  EXPECT_FALSE(first->closed());
  alice->release(second);
  EXPECT_TRUE(first->closed());
  EXPECT_EQ(alice->opened(), 0u);

  alice->release(second);
  EXPECT_EQ(alice->opened(), 0u);

  // reopened core is a fresh one
  EXPECT_OUTCOME_TRUE(reopened, alice->get({.name = "drive"}));
  EXPECT_FALSE(reopened->closed());
  testutil::runCoro(io, alice->close());
  EXPECT_TRUE(reopened->closed());
}

/**
 * @given writable core and a read-only replica
 * @when append to both
 * @then writable core keeps the blocks, replica refuses with READ_ONLY
 */
TEST_F(MemoryCorestoreTest, Append) {
  EXPECT_OUTCOME_TRUE(core, alice->get({.name = "log"}));
  std::vector<uint64_t> appended;
  core->onAppend([&](uint64_t seq, const SignedBlock &) {
    appended.push_back(seq);
  });
  EXPECT_OUTCOME_TRUE(seq0, core->append(str2byte("zero")));
  EXPECT_OUTCOME_TRUE(seq1, core->append(str2byte("one")));
  EXPECT_EQ(seq0, 0u);
  EXPECT_EQ(seq1, 1u);
  EXPECT_EQ(core->length(), 2u);
  auto one = str2byte("one");
  EXPECT_EQ(core->get(1), Buffer(one.begin(), one.end()));
  EXPECT_EQ(core->get(2), std::nullopt);
  EXPECT_EQ(appended, (std::vector<uint64_t>{0, 1}));

  EXPECT_OUTCOME_TRUE(replica, bob->get({.key = core->key()}));
  EXPECT_EC(replica->append(str2byte("x")), StoreError::READ_ONLY);

  // writable cores have nothing to update
  EXPECT_OUTCOME_TRUE(updated, testutil::runCoro(io, core->update()));
  EXPECT_FALSE(updated);
}

/**
 * @given stores replicating over a connection, alice has a core with blocks
 * @when bob updates his replica and alice appends more afterwards
 * @then bob gets the existing blocks and then the new ones without update
 */
TEST_F(MemoryCorestoreTest, Replication) {
  EXPECT_OUTCOME_TRUE(core, alice->get({.name = "log"}));
  EXPECT_OUTCOME_TRUE_1(core->append(str2byte("zero")));
  EXPECT_OUTCOME_TRUE_1(core->append(str2byte("one")));
  connect();

  EXPECT_OUTCOME_TRUE(replica, bob->get({.key = core->key()}));
  EXPECT_OUTCOME_TRUE(updated, testutil::runCoro(io, replica->update()));
  EXPECT_TRUE(updated);
  ASSERT_EQ(replica->length(), 2u);
  EXPECT_EQ(replica->get(0), core->get(0));

  EXPECT_OUTCOME_TRUE_1(core->append(str2byte("two")));
  testutil::runReady(io);
  EXPECT_EQ(replica->length(), 3u);

  // nothing new
  EXPECT_OUTCOME_TRUE(again, testutil::runCoro(io, replica->update()));
  EXPECT_FALSE(again);
}

/**
 * @given stores replicating, alice does not have the requested core
 * @when bob updates his replica
 * @then update finishes as soon as alice reports the core is missing
 */
TEST_F(MemoryCorestoreTest, MissingCore) {
  connect();
  EXPECT_OUTCOME_TRUE(kp, provider->generateKeypair());
  EXPECT_OUTCOME_TRUE(replica, bob->get({.key = kp.public_key}));
  EXPECT_OUTCOME_TRUE(updated, testutil::runCoro(io, replica->update()));
  EXPECT_FALSE(updated);
  EXPECT_EQ(replica->length(), 0u);
}

/**
 * @given replica whose owner is still being looked for
 * @when update is called
 * @then it waits until the search is done
 */
TEST_F(MemoryCorestoreTest, UpdateWaitsForPeers) {
  EXPECT_OUTCOME_TRUE(kp, provider->generateKeypair());
  EXPECT_OUTCOME_TRUE(replica, bob->get({.key = kp.public_key}));
  auto done = replica->findingPeers();

  std::optional<outcome::result<bool>> result;
  coroSpawn(io.get_executor(), [&]() -> Coro<void> {
    result.emplace(co_await replica->update());
  });
  testutil::runReady(io);
  EXPECT_FALSE(result.has_value());

  done();
  // repeated call is no-op
  done();
  testutil::runReady(io);
  ASSERT_TRUE(result.has_value());
  EXPECT_OUTCOME_TRUE(updated, result.value());
  EXPECT_FALSE(updated);
}

/**
 * @given bob replicates over a mocked connection
 * @when a block with a forged signature arrives
 * @then the block is rejected and the connection destroyed
 */
TEST_F(MemoryCorestoreTest, ForgedBlock) {
  EXPECT_OUTCOME_TRUE(kp, provider->generateKeypair());
  EXPECT_OUTCOME_TRUE(replica, bob->get({.key = kp.public_key}));

  auto connection = std::make_shared<network::ConnectionMock>();
  static const network::PublicKey remote{crypto::sha256("remote")};
  ON_CALL(*connection, remotePublicKey())
      .WillByDefault(testing::ReturnRef(remote));
  EXPECT_CALL(*connection, write(_))
      .WillRepeatedly(Return(outcome::success()));
  bob->replicate(connection);

  const std::string protocol{Replicator::kProtocol};
  auto frame = [&](network::MuxFrame::Type type, Buffer payload) {
    EXPECT_OUTCOME_TRUE(
        bytes, scale::encode(network::MuxFrame{type, protocol, payload}));
    return bytes;
  };
  EXPECT_OUTCOME_TRUE(
      forged,
      scale::encode(ReplicationMessage{DataMessage{
          replica->discoveryKey(),
          0,
          {SignedBlock{Buffer{1, 2, 3}, crypto::Ed25519Signature{}}},
      }}));

  EXPECT_CALL(*connection,
              onDestroy(std::error_code{StoreError::INVALID_SIGNATURE}));
  connection->receive(frame(network::MuxFrame::Type::OPEN, {}));
  connection->receive(frame(network::MuxFrame::Type::MESSAGE, forged));
  EXPECT_TRUE(connection->isClosed());
  EXPECT_EQ(replica->length(), 0u);
}
