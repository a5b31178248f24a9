// MediaRelay - WebRTC SFU Signaling Server
// Tests for Session Registry

#include <gtest/gtest.h>
#include "mediarelay/session/session_registry.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace mediarelay {
namespace session {
namespace test {

namespace {

TransportRecord transport(const std::string& id, core::TransportRole role, const std::string& client) {
    TransportRecord record;
    record.id = id;
    record.role = role;
    record.clientId = client;
    return record;
}

ProducerRecord producer(const std::string& id, core::MediaKind kind, const std::string& client) {
    ProducerRecord record;
    record.producerId = id;
    record.kind = kind;
    record.clientId = client;
    return record;
}

ConsumerRecord consumer(const std::string& id, const std::string& producerId, const std::string& client) {
    ConsumerRecord record;
    record.consumerId = id;
    record.producerId = producerId;
    record.clientId = client;
    return record;
}

} // namespace

class SessionRegistryTest : public ::testing::Test {
protected:
    SessionRegistry registry_;
};

// =============================================================================
// Transports
// =============================================================================

TEST_F(SessionRegistryTest, TransportsAreKeyedByClientAndRole) {
    ASSERT_TRUE(registry_.upsertTransport(transport("t-send", core::TransportRole::Producing, "a")).isSuccess());
    ASSERT_TRUE(registry_.upsertTransport(transport("t-recv", core::TransportRole::Consuming, "a")).isSuccess());

    auto send = registry_.findTransport("a", core::TransportRole::Producing);
    auto recv = registry_.findTransport("a", core::TransportRole::Consuming);

    ASSERT_TRUE(send.isSuccess());
    ASSERT_TRUE(recv.isSuccess());
    EXPECT_EQ(send.value().id, "t-send");
    EXPECT_EQ(recv.value().id, "t-recv");
    EXPECT_TRUE(registry_.findTransport("b", core::TransportRole::Producing).isError());
}

TEST_F(SessionRegistryTest, SecondTransportForSameRoleConflicts) {
    ASSERT_TRUE(registry_.upsertTransport(transport("t1", core::TransportRole::Producing, "a")).isSuccess());

    auto second = registry_.upsertTransport(transport("t2", core::TransportRole::Producing, "a"));

    ASSERT_TRUE(second.isError());
    EXPECT_EQ(second.error().code, SessionError::Code::Conflict);
    EXPECT_EQ(registry_.findTransport("a", core::TransportRole::Producing).value().id, "t1");
}

TEST_F(SessionRegistryTest, ReleaseThenReplaceTransport) {
    ASSERT_TRUE(registry_.upsertTransport(transport("t1", core::TransportRole::Producing, "a")).isSuccess());

    auto released = registry_.releaseTransport("a", core::TransportRole::Producing);
    ASSERT_TRUE(released.isSuccess());
    EXPECT_EQ(released.value().id, "t1");

    EXPECT_TRUE(registry_.upsertTransport(transport("t2", core::TransportRole::Producing, "a")).isSuccess());
}

TEST_F(SessionRegistryTest, ReleaseMissingTransportIsNotFound) {
    auto released = registry_.releaseTransport("a", core::TransportRole::Consuming);

    ASSERT_TRUE(released.isError());
    EXPECT_EQ(released.error().code, SessionError::Code::NotFound);
}

TEST_F(SessionRegistryTest, TransportRecordNeedsIdAndClient) {
    auto noId = registry_.upsertTransport(transport("", core::TransportRole::Producing, "a"));
    auto noClient = registry_.upsertTransport(transport("t1", core::TransportRole::Producing, ""));

    ASSERT_TRUE(noId.isError());
    EXPECT_EQ(noId.error().code, SessionError::Code::InvalidArgument);
    ASSERT_TRUE(noClient.isError());
    EXPECT_EQ(noClient.error().code, SessionError::Code::InvalidArgument);
}

// =============================================================================
// Producers
// =============================================================================

TEST_F(SessionRegistryTest, OneProducerPerClient) {
    ASSERT_TRUE(registry_.upsertProducer(producer("p1", core::MediaKind::Video, "a")).isSuccess());

    auto second = registry_.upsertProducer(producer("p2", core::MediaKind::Audio, "a"));

    ASSERT_TRUE(second.isError());
    EXPECT_EQ(second.error().code, SessionError::Code::Conflict);
    EXPECT_EQ(registry_.producerCount(), 1u);
}

TEST_F(SessionRegistryTest, ProducerLookupByClientAndId) {
    ASSERT_TRUE(registry_.upsertProducer(producer("p1", core::MediaKind::Video, "a")).isSuccess());

    auto byClient = registry_.findProducer("a");
    auto byId = registry_.findProducerById("p1");

    ASSERT_TRUE(byClient.isSuccess());
    ASSERT_TRUE(byId.isSuccess());
    EXPECT_EQ(byClient.value().producerId, "p1");
    EXPECT_EQ(byId.value().clientId, "a");
    EXPECT_TRUE(registry_.findProducerById("p2").isError());
}

TEST_F(SessionRegistryTest, ProducerSequenceFollowsCreationOrder) {
    auto first = registry_.upsertProducer(producer("p1", core::MediaKind::Video, "a"));
    auto second = registry_.upsertProducer(producer("p2", core::MediaKind::Video, "b"));

    ASSERT_TRUE(first.isSuccess());
    ASSERT_TRUE(second.isSuccess());
    EXPECT_LT(first.value().sequence, second.value().sequence);
}

TEST_F(SessionRegistryTest, ListProducersExcludesCaller) {
    ASSERT_TRUE(registry_.upsertProducer(producer("pz", core::MediaKind::Video, "z")).isSuccess());
    ASSERT_TRUE(registry_.upsertProducer(producer("pa", core::MediaKind::Audio, "a")).isSuccess());
    ASSERT_TRUE(registry_.upsertProducer(producer("pm", core::MediaKind::Video, "m")).isSuccess());

    auto others = registry_.listProducersExcluding("a");

    ASSERT_EQ(others.size(), 2u);
    EXPECT_EQ(others[0].producerId, "pz");
    EXPECT_EQ(others[1].producerId, "pm");
    for (const auto& record : others) {
        EXPECT_NE(record.clientId, "a");
    }
}

TEST_F(SessionRegistryTest, VideoProducersInCreationOrder) {
    EXPECT_FALSE(registry_.hasVideoProducer());
    ASSERT_TRUE(registry_.upsertProducer(producer("audio", core::MediaKind::Audio, "a")).isSuccess());
    EXPECT_FALSE(registry_.hasVideoProducer());
    ASSERT_TRUE(registry_.upsertProducer(producer("v2", core::MediaKind::Video, "c")).isSuccess());
    ASSERT_TRUE(registry_.upsertProducer(producer("v1", core::MediaKind::Video, "b")).isSuccess());

    auto videos = registry_.videoProducers();

    EXPECT_TRUE(registry_.hasVideoProducer());
    ASSERT_EQ(videos.size(), 2u);
    EXPECT_EQ(videos[0].producerId, "v2");
    EXPECT_EQ(videos[1].producerId, "v1");
}

TEST_F(SessionRegistryTest, ReleaseProducerAllowsNewOne) {
    ASSERT_TRUE(registry_.upsertProducer(producer("p1", core::MediaKind::Video, "a")).isSuccess());

    auto released = registry_.releaseProducer("a");

    ASSERT_TRUE(released.isSuccess());
    EXPECT_EQ(released.value().producerId, "p1");
    EXPECT_TRUE(registry_.findProducerById("p1").isError());
    EXPECT_TRUE(registry_.upsertProducer(producer("p2", core::MediaKind::Video, "a")).isSuccess());
}

// =============================================================================
// Consumers
// =============================================================================

TEST_F(SessionRegistryTest, ConsumersAreCollectedPerClient) {
    ASSERT_TRUE(registry_.upsertConsumer(consumer("c2", "p1", "b")).isSuccess());
    ASSERT_TRUE(registry_.upsertConsumer(consumer("c1", "p2", "b")).isSuccess());
    ASSERT_TRUE(registry_.upsertConsumer(consumer("c3", "p1", "c")).isSuccess());

    auto ofB = registry_.consumersOf("b");

    ASSERT_EQ(ofB.size(), 2u);
    EXPECT_EQ(ofB[0].consumerId, "c1");
    EXPECT_EQ(ofB[1].consumerId, "c2");
    EXPECT_TRUE(registry_.consumersOf("nobody").empty());
}

TEST_F(SessionRegistryTest, ConsumersStartPausedAndCanResume) {
    ASSERT_TRUE(registry_.upsertConsumer(consumer("c1", "p1", "b")).isSuccess());
    EXPECT_TRUE(registry_.findConsumer("b", "c1").value().paused);

    ASSERT_TRUE(registry_.setConsumerPaused("b", "c1", false).isSuccess());

    EXPECT_FALSE(registry_.findConsumer("b", "c1").value().paused);
}

TEST_F(SessionRegistryTest, ConsumerIsOwnedByItsClient) {
    ASSERT_TRUE(registry_.upsertConsumer(consumer("c1", "p1", "b")).isSuccess());

    EXPECT_TRUE(registry_.findConsumer("a", "c1").isError());
    auto paused = registry_.setConsumerPaused("a", "c1", false);
    ASSERT_TRUE(paused.isError());
    EXPECT_EQ(paused.error().code, SessionError::Code::NotFound);
}

TEST_F(SessionRegistryTest, ReleaseConsumer) {
    ASSERT_TRUE(registry_.upsertConsumer(consumer("c1", "p1", "b")).isSuccess());

    auto released = registry_.releaseConsumer("b", "c1");

    ASSERT_TRUE(released.isSuccess());
    EXPECT_EQ(released.value().producerId, "p1");
    EXPECT_TRUE(registry_.releaseConsumer("b", "c1").isError());
}

// =============================================================================
// Disconnect Cleanup
// =============================================================================

TEST_F(SessionRegistryTest, RemoveAllForClientTakesEverything) {
    ASSERT_TRUE(registry_.upsertTransport(transport("ta-send", core::TransportRole::Producing, "a")).isSuccess());
    ASSERT_TRUE(registry_.upsertTransport(transport("ta-recv", core::TransportRole::Consuming, "a")).isSuccess());
    ASSERT_TRUE(registry_.upsertProducer(producer("pa", core::MediaKind::Video, "a")).isSuccess());
    ASSERT_TRUE(registry_.upsertProducer(producer("pb", core::MediaKind::Video, "b")).isSuccess());
    ASSERT_TRUE(registry_.upsertConsumer(consumer("ca-of-b", "pb", "a")).isSuccess());
    ASSERT_TRUE(registry_.upsertConsumer(consumer("cb-of-a", "pa", "b")).isSuccess());
    registry_.markCapabilitiesRequested("a");

    RemovedResources removed = registry_.removeAllForClient("a");

    EXPECT_EQ(removed.transports.size(), 2u);
    ASSERT_TRUE(removed.producer.has_value());
    EXPECT_EQ(removed.producer->producerId, "pa");
    ASSERT_EQ(removed.consumers.size(), 1u);
    EXPECT_EQ(removed.consumers[0].consumerId, "ca-of-b");
    ASSERT_EQ(removed.orphanedConsumers.size(), 1u);
    EXPECT_EQ(removed.orphanedConsumers[0].consumerId, "cb-of-a");

    EXPECT_FALSE(registry_.hasClient("a"));
    EXPECT_FALSE(registry_.capabilitiesRequested("a"));
    EXPECT_TRUE(registry_.findProducerById("pa").isError());
    EXPECT_TRUE(registry_.consumersOf("b").empty());
    EXPECT_EQ(registry_.producerCount(), 1u);
}

TEST_F(SessionRegistryTest, NoConsumerOutlivesItsProducer) {
    ASSERT_TRUE(registry_.upsertProducer(producer("pa", core::MediaKind::Video, "a")).isSuccess());
    for (const char* client : {"b", "c", "d"}) {
        ASSERT_TRUE(registry_.upsertConsumer(
            consumer(std::string("c-") + client, "pa", client)).isSuccess());
    }

    registry_.removeAllForClient("a");

    for (const char* client : {"b", "c", "d"}) {
        for (const auto& record : registry_.consumersOf(client)) {
            EXPECT_NE(record.producerId, "pa");
        }
    }
}

TEST_F(SessionRegistryTest, RemoveUnknownClientIsEmpty) {
    RemovedResources removed = registry_.removeAllForClient("ghost");

    EXPECT_TRUE(removed.empty());
}

// =============================================================================
// Capabilities
// =============================================================================

TEST_F(SessionRegistryTest, CapabilitiesNotFoundUntilSet) {
    auto before = registry_.capabilities("a");
    ASSERT_TRUE(before.isError());
    EXPECT_EQ(before.error().code, SessionError::Code::NotFound);

    engine::RtpCapabilities caps;
    engine::RtpCodecCapability opus;
    opus.mimeType = "audio/opus";
    opus.clockRate = 48000;
    caps.codecs.push_back(opus);
    registry_.setCapabilities("a", caps);

    auto after = registry_.capabilities("a");
    ASSERT_TRUE(after.isSuccess());
    ASSERT_EQ(after.value().codecs.size(), 1u);
    EXPECT_EQ(after.value().codecs[0].mimeType, "audio/opus");
}

TEST_F(SessionRegistryTest, CapabilitiesRequestedFlag) {
    EXPECT_FALSE(registry_.capabilitiesRequested("a"));

    registry_.markCapabilitiesRequested("a");

    EXPECT_TRUE(registry_.capabilitiesRequested("a"));
    EXPECT_TRUE(registry_.hasClient("a"));
}

// =============================================================================
// Error Mapping
// =============================================================================

TEST(SessionErrorTest, MapsOntoSignalingErrors) {
    EXPECT_EQ(toError(SessionError{SessionError::Code::NotFound, "x"}).code, core::ErrorCode::NotFound);
    EXPECT_EQ(toError(SessionError{SessionError::Code::Conflict, "x"}).code, core::ErrorCode::Conflict);
    EXPECT_EQ(toError(SessionError{SessionError::Code::InvalidArgument, "x"}).code,
              core::ErrorCode::InvalidArgument);
    EXPECT_EQ(toError(SessionError{SessionError::Code::Conflict, "busy"}).message, "busy");
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_F(SessionRegistryTest, ConcurrentClientsDoNotInterfere) {
    constexpr int CLIENTS = 8;
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};

    for (int i = 0; i < CLIENTS; ++i) {
        threads.emplace_back([this, i, &failures]() {
            std::string client = "client-" + std::to_string(i);
            for (int round = 0; round < 50; ++round) {
                std::string suffix = std::to_string(i) + "-" + std::to_string(round);
                if (registry_.upsertProducer(producer("p" + suffix, core::MediaKind::Video, client)).isError()) {
                    ++failures;
                }
                if (registry_.upsertConsumer(consumer("c" + suffix, "p" + suffix, client)).isError()) {
                    ++failures;
                }
                registry_.removeAllForClient(client);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(registry_.producerCount(), 0u);
}

} // namespace test
} // namespace session
} // namespace mediarelay
