/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "identity/slashtag.hpp"

#include <gtest/gtest.h>

#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "crypto/sha/sha256.hpp"
#include "mock/core/store/corestore_mock.hpp"
#include "network/impl/memory_network.hpp"
#include "protocol/slash_protocol.hpp"
#include "store/impl/memory_corestore.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/run_coro.hpp"

using namespace slashtags;
using namespace slashtags::identity;
using namespace std::chrono_literals;
using common::str2byte;
using testing::_;

class SlashtagTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    network = std::make_shared<network::MemoryNetwork>(io, provider);
  }

  std::shared_ptr<Slashtag> local(std::string_view name) {
    EXPECT_OUTCOME_TRUE(
        kp, Slashtag::createKeyPair(crypto::sha256("primary").view(), name));
    return make({.key_pair = kp});
  }

  std::shared_ptr<Slashtag> make(SlashtagOptions options) {
    options.ed25519_provider = provider;
    options.swarm_options.connect_timeout = 200ms;
    options.store_options.update_timeout = 200ms;
    EXPECT_OUTCOME_TRUE(slashtag,
                        Slashtag::create(io, network, std::move(options)));
    return slashtag;
  }

  boost::asio::io_context io;
  std::shared_ptr<crypto::Ed25519Provider> provider =
      std::make_shared<crypto::Ed25519ProviderImpl>();
  std::shared_ptr<network::MemoryNetwork> network;
};

/**
 * @given options without identity, or without swarm factory
 * @when create slashtag
 * @then creation fails with the matching error
 */
TEST_F(SlashtagTest, CreateErrors) {
  EXPECT_EC(Slashtag::create(io, network, {}),
            SlashtagError::INVALID_IDENTITY);
  EXPECT_EC(Slashtag::create(io, network, {.url = "slash:nonsense"}),
            SlashtagError::INVALID_IDENTITY);
  EXPECT_OUTCOME_TRUE(kp, Slashtag::createKeyPair());
  EXPECT_EC(Slashtag::create(io, nullptr, {.key_pair = kp}),
            SlashtagError::MISSING_SWARM_FACTORY);
}

/**
 * @given key pair, public key, and url of the same identity
 * @when create slashtags from them
 * @then all have the same key, only the first one is local
 */
TEST_F(SlashtagTest, Identity) {
  auto alice = local("alice");
  EXPECT_FALSE(alice->remote());
  EXPECT_EQ(alice->url().toString(), "slash:" + alice->id());
  EXPECT_EQ(alice->state(), Slashtag::State::UNINITIALIZED);

  auto by_key = make({.key = alice->key()});
  auto by_url = make({.url = alice->url().toString()});
  EXPECT_TRUE(by_key->remote());
  EXPECT_TRUE(by_url->remote());
  EXPECT_EQ(by_key->key(), alice->key());
  EXPECT_EQ(by_url->key(), alice->key());

  // derivation is deterministic
  EXPECT_EQ(local("alice")->key(), alice->key());
  EXPECT_NE(local("bob")->key(), alice->key());
}

/**
 * @given slashtag
 * @when ready is requested twice concurrently and once more afterwards
 * @then a single session is created and the public drive is writable
 */
TEST_F(SlashtagTest, ReadyOnce) {
  auto alice = local("alice");
  std::vector<outcome::result<void>> results;
  for (int i = 0; i < 2; ++i) {
    coroSpawn(io.get_executor(), [&]() -> Coro<void> {
      results.emplace_back(co_await alice->ready());
    });
  }
  while (results.size() < 2) {
    ASSERT_NE(io.run_one(), 0u);
  }
  EXPECT_OUTCOME_TRUE_1(results[0]);
  EXPECT_OUTCOME_TRUE_1(results[1]);
  EXPECT_OUTCOME_TRUE_1(testutil::runCoro(io, alice->ready()));

  EXPECT_EQ(alice->state(), Slashtag::State::READY);
  EXPECT_EQ(network->sessions(), 1u);
  ASSERT_NE(alice->publicDrive(), nullptr);
  EXPECT_TRUE(alice->publicDrive()->writable());
  EXPECT_EQ(alice->publicDrive()->key(), alice->key());
}

/**
 * @given remote slashtag whose ready waits for the peers of its drive
 * @when three callers request ready while the first one is still running
 * @then all of them succeed over a single session
 */
TEST_F(SlashtagTest, ConcurrentReady) {
  auto alice = local("alice");
  EXPECT_OUTCOME_TRUE_1(testutil::runCoro(io, alice->ready()));
  EXPECT_EQ(network->sessions(), 1u);

  auto viewer = make({.key = alice->key()});
  std::vector<Slashtag::State> states;
  std::vector<outcome::result<void>> results;
  for (int i = 0; i < 3; ++i) {
    coroSpawn(io.get_executor(), [&]() -> Coro<void> {
      states.push_back(viewer->state());
      results.emplace_back(co_await viewer->ready());
    });
  }
  while (results.size() < 3) {
    ASSERT_NE(io.run_one(), 0u);
  }

  EXPECT_EQ(states,
            (std::vector{Slashtag::State::UNINITIALIZED,
                         Slashtag::State::INITIALIZING,
                         Slashtag::State::INITIALIZING}));
  for (auto &result : results) {
    EXPECT_OUTCOME_TRUE_1(result);
  }
  EXPECT_EQ(viewer->state(), Slashtag::State::READY);
  EXPECT_EQ(network->sessions(), 2u);
  ASSERT_NE(viewer->publicDrive(), nullptr);
  EXPECT_FALSE(viewer->publicDrive()->writable());
}

/**
 * @given ready slashtag with a registered protocol and two peers connected
 * @when close it twice
 * @then close observers and connection close handlers run once, session is
 * destroyed and further operations report ALREADY_CLOSED
 */
TEST_F(SlashtagTest, Close) {
  protocol::ProtocolDescriptor chat{
      "chat",
      [](const std::shared_ptr<Slashtag> &slashtag)
          -> std::shared_ptr<protocol::Protocol> {
        return std::make_shared<protocol::SlashProtocol>(slashtag, "chat");
      },
  };
  auto alice = local("alice");
  auto bob = local("bob");
  auto carol = local("carol");
  EXPECT_OUTCOME_TRUE_1(alice->protocol(chat));
  EXPECT_OUTCOME_TRUE_1(testutil::runCoro(io, alice->listen()));
  auto drive = alice->publicDrive();

  std::vector<std::shared_ptr<network::Connection>> connections;
  alice->onConnection(
      [&](const std::shared_ptr<network::Connection> &connection,
          const PeerInfo &) { connections.push_back(connection); });
  EXPECT_OUTCOME_TRUE_1(
      testutil::runCoro(io, bob->connect(Target{alice->key()})));
  EXPECT_OUTCOME_TRUE_1(
      testutil::runCoro(io, carol->connect(Target{alice->key()})));
  testutil::runReady(io);
  ASSERT_EQ(connections.size(), 2u);
  std::vector<int> connection_closes(connections.size(), 0);
  for (size_t i = 0; i < connections.size(); ++i) {
    connections[i]->onClose([&connection_closes, i] {
      ++connection_closes[i];
    });
  }

  int closes = 0;
  alice->onClose([&] { ++closes; });
  testutil::runCoro(io, alice->close());
  testutil::runCoro(io, alice->close());
  testutil::runReady(io);

  EXPECT_EQ(closes, 1);
  EXPECT_EQ(connection_closes, (std::vector{1, 1}));
  EXPECT_EQ(alice->connection(bob->key()), nullptr);
  EXPECT_EQ(bob->connection(alice->key()), nullptr);
  EXPECT_TRUE(alice->closed());
  EXPECT_TRUE(drive->closed());
  EXPECT_EQ(network->sessions(), 0u);
  EXPECT_EC(testutil::runCoro(io, alice->ready()),
            SlashtagError::ALREADY_CLOSED);
  EXPECT_EC(testutil::runCoro(io, alice->connect(Target{alice->key()})),
            SlashtagError::ALREADY_CLOSED);
  EXPECT_EC(testutil::runCoro(io, alice->drive({.name = "x"})),
            SlashtagError::ALREADY_CLOSED);
  EXPECT_EC(alice->protocol(chat), SlashtagError::ALREADY_CLOSED);
  EXPECT_EC(testutil::runCoro(io, alice->unlisten()),
            SlashtagError::ALREADY_CLOSED);
}

/**
 * @given slashtag which was never ready
 * @when close it
 * @then it is closed without starting a session
 */
TEST_F(SlashtagTest, CloseBeforeReady) {
  auto alice = local("alice");
  testutil::runCoro(io, alice->close());
  EXPECT_TRUE(alice->closed());
  EXPECT_EQ(network->sessions(), 0u);
}

/**
 * @given remote slashtag whose ready waits for peers of its drive
 * @when close it before ready completes
 * @then ready reports ALREADY_CLOSED and the session is destroyed
 */
TEST_F(SlashtagTest, CloseDuringReady) {
  auto alice = local("alice");
  auto viewer = make({.key = alice->key()});
  std::optional<outcome::result<void>> ready;
  coroSpawn(io.get_executor(), [&]() -> Coro<void> {
    ready.emplace(co_await viewer->ready());
  });
  ASSERT_EQ(io.run_one(), 1u);
  EXPECT_EQ(viewer->state(), Slashtag::State::INITIALIZING);

  testutil::runCoro(io, viewer->close());
  ASSERT_TRUE(ready.has_value());
  EXPECT_EC(ready.value(), SlashtagError::ALREADY_CLOSED);
  EXPECT_TRUE(viewer->closed());
  EXPECT_EQ(network->sessions(), 0u);
}

/**
 * @given listening alice and bob
 * @when bob connects to alice by URL twice
 * @then one connection is opened, alice sees bob as remote peer
 */
TEST_F(SlashtagTest, Connect) {
  auto alice = local("alice");
  auto bob = local("bob");
  EXPECT_OUTCOME_TRUE_1(testutil::runCoro(io, alice->listen()));

  std::vector<PeerInfo> alice_peers;
  alice->onConnection(
      [&](const std::shared_ptr<network::Connection> &, const PeerInfo &info) {
        alice_peers.push_back(info);
      });
  std::vector<PeerInfo> bob_peers;
  bob->onConnection(
      [&](const std::shared_ptr<network::Connection> &, const PeerInfo &info) {
        bob_peers.push_back(info);
      });

  EXPECT_OUTCOME_TRUE(
      first,
      testutil::runCoro(io, bob->connect(Target{alice->url().toString()})));
  EXPECT_OUTCOME_TRUE(second,
                      testutil::runCoro(io, bob->connect(Target{alice->id()})));
  EXPECT_EQ(first, second);
  EXPECT_EQ(first->remotePublicKey(), alice->key());
  EXPECT_EQ(bob->connection(alice->key()), first);

  ASSERT_EQ(alice_peers.size(), 1u);
  EXPECT_EQ(alice_peers[0].public_key, bob->key());
  EXPECT_FALSE(alice_peers[0].client);
  ASSERT_NE(alice_peers[0].slashtag, nullptr);
  EXPECT_TRUE(alice_peers[0].slashtag->remote());
  EXPECT_EQ(alice_peers[0].slashtag->key(), bob->key());

  ASSERT_EQ(bob_peers.size(), 1u);
  EXPECT_EQ(bob_peers[0].public_key, alice->key());
  EXPECT_TRUE(bob_peers[0].client);
  ASSERT_NE(bob_peers[0].slashtag, nullptr);
  EXPECT_TRUE(bob_peers[0].slashtag->remote());
  EXPECT_EQ(bob_peers[0].slashtag->key(), alice->key());

  // alice goes away
  testutil::runCoro(io, alice->close());
  testutil::runReady(io);
  EXPECT_EQ(bob->connection(alice->key()), nullptr);
}

/**
 * @given slashtags
 * @when connect to itself, to a malformed target, or from a remote one
 * @then errors are returned without touching the network
 */
TEST_F(SlashtagTest, ConnectErrors) {
  auto alice = local("alice");
  EXPECT_EC(testutil::runCoro(io, alice->connect(Target{alice->key()})),
            SlashtagError::SELF_CONNECT);
  EXPECT_EC(
      testutil::runCoro(io, alice->connect(Target{std::string{"not a key"}})),
      SlashUrlError::INVALID_KEY);

  auto remote = make({.key = alice->key()});
  EXPECT_EC(testutil::runCoro(io, remote->connect(Target{alice->key()})),
            SlashtagError::REMOTE_IDENTITY);
  EXPECT_EC(testutil::runCoro(io, remote->listen()),
            SlashtagError::REMOTE_IDENTITY);
  EXPECT_EC(testutil::runCoro(io, remote->unlisten()),
            SlashtagError::REMOTE_IDENTITY);
  EXPECT_EQ(network->sessions(), 0u);
}

/**
 * @given alice listening with bob connected
 * @when alice stops listening, then listens again
 * @then new peers can not reach her until she listens again, bob stays
 * connected meanwhile
 */
TEST_F(SlashtagTest, Unlisten) {
  auto alice = local("alice");
  auto bob = local("bob");
  auto carol = local("carol");

  // nothing to stop before the session starts
  EXPECT_OUTCOME_TRUE_1(testutil::runCoro(io, alice->unlisten()));
  EXPECT_EQ(network->sessions(), 0u);

  EXPECT_OUTCOME_TRUE_1(testutil::runCoro(io, alice->listen()));
  auto topic = alice->publicDrive()->discoveryKey();
  EXPECT_EQ(network->servers(topic), 1u);
  EXPECT_OUTCOME_TRUE(to_alice,
                      testutil::runCoro(io, bob->connect(Target{alice->key()})));

  EXPECT_OUTCOME_TRUE_1(testutil::runCoro(io, alice->unlisten()));
  EXPECT_OUTCOME_TRUE_1(testutil::runCoro(io, alice->unlisten()));
  EXPECT_EQ(network->servers(topic), 0u);
  EXPECT_EC(testutil::runCoro(io, carol->connect(Target{alice->key()})),
            network::SwarmError::CONNECT_TIMEOUT);
  EXPECT_FALSE(to_alice->isClosed());
  EXPECT_EQ(bob->connection(alice->key()), to_alice);

  EXPECT_OUTCOME_TRUE_1(testutil::runCoro(io, alice->listen()));
  EXPECT_EQ(network->servers(topic), 1u);
  EXPECT_OUTCOME_TRUE(to_alice_again,
                      testutil::runCoro(io, carol->connect(Target{alice->key()})));
  EXPECT_EQ(to_alice_again->remotePublicKey(), alice->key());
}

/**
 * @given bob unreachable
 * @when alice connects to him
 * @then connect times out
 */
TEST_F(SlashtagTest, ConnectTimeout) {
  auto alice = local("alice");
  auto bob = local("bob");
  EXPECT_EC(testutil::runCoro(io, alice->connect(Target{bob->key()})),
            network::SwarmError::CONNECT_TIMEOUT);
}

/**
 * @given ready slashtag
 * @when open the same named drive twice
 * @then the cached drive is returned and announced only once
 */
TEST_F(SlashtagTest, DriveCache) {
  auto alice = local("alice");
  EXPECT_OUTCOME_TRUE(first,
                      testutil::runCoro(io, alice->drive({.name = "contacts"})));
  EXPECT_OUTCOME_TRUE(second,
                      testutil::runCoro(io, alice->drive({.name = "contacts"})));
  EXPECT_OUTCOME_TRUE(
      by_key, testutil::runCoro(io, alice->drive({.key = first->key()})));
  EXPECT_EQ(first, second);
  EXPECT_EQ(first, by_key);
  EXPECT_TRUE(first->writable());
  EXPECT_NE(first->key(), alice->key());
  EXPECT_EQ(network->servers(first->discoveryKey()), 1u);
}

/**
 * @given slashtag over a store which counts opened cores
 * @when open the same named drive many times and close the slashtag
 * @then the core is opened once and every reference is released on close
 */
TEST_F(SlashtagTest, NamedDriveOpenedOnce) {
  auto root = std::make_shared<store::MemoryCorestore>(provider,
                                                       crypto::sha256("root"));
  auto root_mock = std::make_shared<testing::NiceMock<store::CorestoreMock>>();
  auto ns_mock = std::make_shared<testing::NiceMock<store::CorestoreMock>>();
  std::shared_ptr<store::MemoryCorestore> ns;
  EXPECT_CALL(*root_mock, namespaced(_))
      .WillOnce([&](common::BufferView key) -> std::shared_ptr<store::Corestore> {
        ns = std::dynamic_pointer_cast<store::MemoryCorestore>(
            root->namespaced(key));
        ns_mock->delegateTo(ns);
        return ns_mock;
      });
  // public drive and "contacts"
  EXPECT_CALL(*ns_mock, get(_)).Times(2);

  EXPECT_OUTCOME_TRUE(
      kp, Slashtag::createKeyPair(crypto::sha256("primary").view(), "alice"));
  auto alice = make({.key_pair = kp, .store = root_mock});
  ASSERT_NE(ns, nullptr);
  EXPECT_OUTCOME_TRUE_1(testutil::runCoro(io, alice->ready()));
  EXPECT_EQ(ns->opened(), 1u);

  EXPECT_OUTCOME_TRUE(first,
                      testutil::runCoro(io, alice->drive({.name = "contacts"})));
  for (int i = 0; i < 500; ++i) {
    EXPECT_OUTCOME_TRUE(again,
                        testutil::runCoro(io, alice->drive({.name = "contacts"})));
    EXPECT_EQ(again, first);
  }
  EXPECT_EQ(ns->opened(), 2u);

  testutil::runCoro(io, alice->close());
  EXPECT_EQ(ns->opened(), 0u);
  EXPECT_TRUE(ns->closed());
  EXPECT_FALSE(root->closed());
}

/**
 * @given ready alice
 * @when set profile and read it locally and through a remote identity of
 * a peer
 * @then both read the same document
 */
TEST_F(SlashtagTest, Profile) {
  auto alice = local("alice");
  EXPECT_OUTCOME_TRUE(none, testutil::runCoro(io, alice->getProfile()));
  EXPECT_FALSE(none.has_value());

  rapidjson::Document profile;
  profile.SetObject();
  profile.AddMember("name", "Alice", profile.GetAllocator());
  EXPECT_OUTCOME_TRUE_1(testutil::runCoro(io, alice->setProfile(profile)));

  EXPECT_OUTCOME_TRUE(own, testutil::runCoro(io, alice->getProfile()));
  ASSERT_TRUE(own.has_value());
  EXPECT_STREQ((*own)["name"].GetString(), "Alice");

  auto viewer = make({.key = alice->key()});
  EXPECT_OUTCOME_TRUE(seen, testutil::runCoro(io, viewer->getProfile()));
  ASSERT_TRUE(seen.has_value());
  EXPECT_STREQ((*seen)["name"].GetString(), "Alice");

  EXPECT_EC(testutil::runCoro(io, viewer->setProfile(profile)),
            SlashtagError::REMOTE_IDENTITY);
}

/**
 * @given local and remote identity of the same key
 * @when sign with the local one and verify with the remote one
 * @then signature is valid, remote identity can not sign
 */
TEST_F(SlashtagTest, SignVerify) {
  auto alice = local("alice");
  auto remote = make({.key = alice->key()});
  auto message = str2byte("hello");

  EXPECT_OUTCOME_TRUE(signature, alice->sign(message));
  EXPECT_OUTCOME_TRUE(valid, remote->verify(message, signature));
  EXPECT_TRUE(valid);
  EXPECT_OUTCOME_TRUE(forged, remote->verify(str2byte("bye"), signature));
  EXPECT_FALSE(forged);
  EXPECT_EC(remote->sign(message), SlashtagError::REMOTE_IDENTITY);
}

/**
 * @given protocol descriptor
 * @when register it twice
 * @then the same instance is returned, remote identities refuse it
 */
TEST_F(SlashtagTest, ProtocolRegistry) {
  int created = 0;
  protocol::ProtocolDescriptor descriptor{
      "counter",
      [&created](const std::shared_ptr<Slashtag> &slashtag)
          -> std::shared_ptr<protocol::Protocol> {
        ++created;
        return std::make_shared<protocol::SlashProtocol>(slashtag, "counter");
      },
  };
  auto alice = make({
      .key_pair = Slashtag::createKeyPair().value(),
      .protocols = {descriptor},
  });
  EXPECT_EQ(created, 1);
  EXPECT_OUTCOME_TRUE(first, alice->protocol(descriptor));
  EXPECT_OUTCOME_TRUE(second, alice->protocol(descriptor));
  EXPECT_EQ(first, second);
  EXPECT_EQ(first->name(), "counter");
  EXPECT_EQ(created, 1);

  auto remote = make({.key = alice->key()});
  EXPECT_EC(remote->protocol(descriptor), SlashtagError::REMOTE_IDENTITY);
}
