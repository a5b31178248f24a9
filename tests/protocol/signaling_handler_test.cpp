// MediaRelay - WebRTC SFU Signaling Server
// Tests for Signaling Handler
//
// Tests cover:
// - Method ordering checks (PreconditionFailed)
// - Transport, producer and consumer creation with registry bookkeeping
// - newProducer / producerClosed fan-out
// - Disconnect cleanup across clients
// - Broadcast methods forwarded to the stream lifecycle manager
// - Envelope handling in handleText

#include <gtest/gtest.h>
#include "mediarelay/protocol/signaling_handler.hpp"
#include "mediarelay/protocol/signaling_message.hpp"
#include "mediarelay/streaming/stream_lifecycle.hpp"
#include "support/fake_stream_lifecycle.hpp"
#include "support/mock_media_engine.hpp"
#include "support/rtp_fixtures.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace mediarelay {
namespace protocol {
namespace test {

using mediarelay::test::FakeStreamLifecycle;
using mediarelay::test::MockMediaEngine;

class SignalingHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_ = std::make_shared<MockMediaEngine>();
        facade_ = std::make_unique<engine::EngineFacade>(engine_);
        handler_ = std::make_unique<SignalingHandler>(sessions_, clients_, *facade_, streams_);
    }

    void connect(const std::string& clientId) {
        core::ClientInfo info;
        info.ip = "127.0.0.1";
        info.port = 50000;
        ASSERT_TRUE(handler_->onConnect(clientId, info,
            [this, clientId](const std::string& event, const core::JsonValue& data) {
                events_[clientId].emplace_back(event, data);
            }));
    }

    core::Result<core::JsonValue, core::Error> request(
        const std::string& clientId,
        const std::string& method,
        const core::JsonValue& data = core::JsonValue::object()
    ) {
        return handler_->handleRequest(clientId, method, data);
    }

    static core::JsonValue dtlsJson() {
        engine::DtlsParameters dtls;
        dtls.role = "client";
        dtls.fingerprints.push_back(engine::DtlsFingerprint{"sha-256", "11:22:33"});
        core::JsonValue data = core::JsonValue::object();
        data.set("dtlsParameters", engine::toJson(dtls));
        return data;
    }

    void negotiate(const std::string& clientId,
                   const engine::RtpCapabilities& capabilities = mediarelay::test::fullBrowserCapabilities()) {
        ASSERT_TRUE(request(clientId, "rtpCapabilities").isSuccess());
        core::JsonValue data = core::JsonValue::object();
        data.set("rtpCapabilities", engine::toJson(capabilities));
        ASSERT_TRUE(request(clientId, "setRtpCapabilities", data).isSuccess());
    }

    /**
     * @brief Connect, create and connect a producing transport and produce video.
     */
    std::string startProducing(const std::string& clientId) {
        auto transport = request(clientId, "createProducerTransport");
        EXPECT_TRUE(transport.isSuccess());
        EXPECT_TRUE(request(clientId, "connectProducerTransport", dtlsJson()).isSuccess());

        core::JsonValue data = core::JsonValue::object();
        data.set("kind", "video");
        data.set("rtpParameters", engine::toJson(mediarelay::test::h264Parameters()));
        auto produced = request(clientId, "produce", data);
        EXPECT_TRUE(produced.isSuccess());
        return produced.isSuccess() ? produced.value()["id"].getString() : std::string();
    }

    void prepareConsumer(const std::string& clientId) {
        negotiate(clientId);
        ASSERT_TRUE(request(clientId, "createConsumerTransport").isSuccess());
        ASSERT_TRUE(request(clientId, "connectConsumerTransport", dtlsJson()).isSuccess());
    }

    core::Result<core::JsonValue, core::Error> consume(const std::string& clientId,
                                                       const std::string& producerId) {
        core::JsonValue data = core::JsonValue::object();
        data.set("producerId", producerId);
        return request(clientId, "consume", data);
    }

    std::vector<std::string> eventNames(const std::string& clientId) {
        std::vector<std::string> names;
        for (const auto& event : events_[clientId]) {
            names.push_back(event.first);
        }
        return names;
    }

    session::SessionRegistry sessions_;
    session::ClientRegistry clients_;
    FakeStreamLifecycle streams_;
    std::shared_ptr<MockMediaEngine> engine_;
    std::unique_ptr<engine::EngineFacade> facade_;
    std::unique_ptr<SignalingHandler> handler_;
    std::map<std::string, std::vector<std::pair<std::string, core::JsonValue>>> events_;
};

// =============================================================================
// Connection
// =============================================================================

TEST_F(SignalingHandlerTest, ConnectSendsClientId) {
    connect("a");

    ASSERT_EQ(events_["a"].size(), 1u);
    EXPECT_EQ(events_["a"][0].first, "connected");
    EXPECT_EQ(events_["a"][0].second["clientId"].getString(), "a");
    EXPECT_TRUE(clients_.contains("a"));
}

TEST_F(SignalingHandlerTest, DuplicateClientIdIsRefused) {
    connect("a");

    EXPECT_FALSE(handler_->onConnect("a", core::ClientInfo{},
        [](const std::string&, const core::JsonValue&) {}));
}

// =============================================================================
// Capabilities
// =============================================================================

TEST_F(SignalingHandlerTest, RtpCapabilitiesReturnsRouterCodecs) {
    connect("a");

    auto result = request("a", "rtpCapabilities");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value()["rtpCapabilities"]["codecs"].size(), 3u);
    EXPECT_TRUE(sessions_.capabilitiesRequested("a"));
}

TEST_F(SignalingHandlerTest, RtpCapabilitiesWithoutEngineIsUnavailable) {
    connect("a");
    engine_->ready = false;

    auto result = request("a", "rtpCapabilities");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::EngineUnavailable);
}

TEST_F(SignalingHandlerTest, SetCapabilitiesBeforeRequestingFails) {
    connect("a");
    core::JsonValue data = core::JsonValue::object();
    data.set("rtpCapabilities", engine::toJson(mediarelay::test::fullBrowserCapabilities()));

    auto result = request("a", "setRtpCapabilities", data);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::PreconditionFailed);
}

TEST_F(SignalingHandlerTest, SetCapabilitiesAcceptsBareObject) {
    connect("a");
    ASSERT_TRUE(request("a", "rtpCapabilities").isSuccess());

    auto result = request("a", "setRtpCapabilities",
                          engine::toJson(mediarelay::test::audioOnlyCapabilities()));

    ASSERT_TRUE(result.isSuccess());
    EXPECT_TRUE(result.value()["success"].getBool());
    ASSERT_TRUE(sessions_.capabilities("a").isSuccess());
    EXPECT_EQ(sessions_.capabilities("a").value().codecs.size(), 1u);
}

TEST_F(SignalingHandlerTest, SetCapabilitiesRejectsMalformedObject) {
    connect("a");
    ASSERT_TRUE(request("a", "rtpCapabilities").isSuccess());
    core::JsonValue data = core::JsonValue::object();
    data.set("rtpCapabilities", core::JsonValue::object());

    auto result = request("a", "setRtpCapabilities", data);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::InvalidArgument);
}

// =============================================================================
// Transports
// =============================================================================

TEST_F(SignalingHandlerTest, CreateTransportReturnsConnectionOptions) {
    connect("a");

    auto result = request("a", "createProducerTransport");

    ASSERT_TRUE(result.isSuccess());
    const core::JsonValue& options = result.value();
    EXPECT_FALSE(options["id"].getString().empty());
    EXPECT_TRUE(options["iceParameters"].isObject());
    EXPECT_TRUE(options["iceCandidates"].isArray());
    EXPECT_TRUE(options["dtlsParameters"].isObject());
    EXPECT_TRUE(sessions_.findTransport("a", core::TransportRole::Producing).isSuccess());
}

TEST_F(SignalingHandlerTest, SecondTransportOfSameRoleConflicts) {
    connect("a");
    ASSERT_TRUE(request("a", "createConsumerTransport").isSuccess());

    auto second = request("a", "createConsumerTransport");

    ASSERT_TRUE(second.isError());
    EXPECT_EQ(second.error().code, core::ErrorCode::Conflict);
    EXPECT_EQ(engine_->transportCount(), 1u);
}

TEST_F(SignalingHandlerTest, TransportCreationFailureLeavesNoRecord) {
    connect("a");
    engine_->failCreateTransport = engine::EngineError(engine::EngineError::Code::ResourceExhausted, "no ports");

    auto result = request("a", "createProducerTransport");

    ASSERT_TRUE(result.isError());
    EXPECT_FALSE(sessions_.findTransport("a", core::TransportRole::Producing).isSuccess());
}

TEST_F(SignalingHandlerTest, ConnectWithoutTransportIsPrecondition) {
    connect("a");

    auto result = request("a", "connectConsumerTransport", dtlsJson());

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::PreconditionFailed);
}

TEST_F(SignalingHandlerTest, ConnectNeedsDtlsParameters) {
    connect("a");
    ASSERT_TRUE(request("a", "createProducerTransport").isSuccess());

    auto result = request("a", "connectProducerTransport");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::InvalidArgument);
}

TEST_F(SignalingHandlerTest, ConnectTwiceIsConnectError) {
    connect("a");
    auto transport = request("a", "createProducerTransport");
    ASSERT_TRUE(transport.isSuccess());
    ASSERT_TRUE(request("a", "connectProducerTransport", dtlsJson()).isSuccess());

    auto again = request("a", "connectProducerTransport", dtlsJson());

    ASSERT_TRUE(again.isError());
    EXPECT_EQ(again.error().code, core::ErrorCode::ConnectError);
    EXPECT_TRUE(engine_->isTransportConnected(transport.value()["id"].getString()));
}

// =============================================================================
// Produce
// =============================================================================

TEST_F(SignalingHandlerTest, ProduceWithoutTransportIsPrecondition) {
    connect("a");
    core::JsonValue data = core::JsonValue::object();
    data.set("kind", "video");
    data.set("rtpParameters", engine::toJson(mediarelay::test::h264Parameters()));

    auto result = request("a", "produce", data);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::PreconditionFailed);
}

TEST_F(SignalingHandlerTest, ProduceValidatesKind) {
    connect("a");
    ASSERT_TRUE(request("a", "createProducerTransport").isSuccess());
    core::JsonValue data = core::JsonValue::object();
    data.set("kind", "screen");
    data.set("rtpParameters", engine::toJson(mediarelay::test::h264Parameters()));

    auto result = request("a", "produce", data);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::InvalidArgument);
}

TEST_F(SignalingHandlerTest, ProduceAnnouncesToOthersOnly) {
    connect("a");
    connect("b");

    std::string producerId = startProducing("a");

    ASSERT_FALSE(producerId.empty());
    EXPECT_TRUE(engine_->hasProducer(producerId));
    ASSERT_TRUE(sessions_.findProducer("a").isSuccess());
    EXPECT_EQ(sessions_.findProducer("a").value().producerId, producerId);

    ASSERT_EQ(events_["b"].size(), 2u);
    EXPECT_EQ(events_["b"][1].first, "newProducer");
    EXPECT_EQ(events_["b"][1].second["producerId"].getString(), producerId);
    EXPECT_EQ(events_["b"][1].second["clientId"].getString(), "a");
    EXPECT_EQ(eventNames("a"), std::vector<std::string>{"connected"});
}

TEST_F(SignalingHandlerTest, SecondProduceConflicts) {
    connect("a");
    startProducing("a");
    core::JsonValue data = core::JsonValue::object();
    data.set("kind", "audio");
    data.set("rtpParameters", engine::toJson(mediarelay::test::opusParameters()));

    auto result = request("a", "produce", data);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::Conflict);
    EXPECT_EQ(engine_->producerCount(), 1u);
}

TEST_F(SignalingHandlerTest, EngineProduceFailureIsProduceError) {
    connect("a");
    ASSERT_TRUE(request("a", "createProducerTransport").isSuccess());
    engine_->failProduce = engine::EngineError(engine::EngineError::Code::InvalidParameters, "bad codec");
    core::JsonValue data = core::JsonValue::object();
    data.set("kind", "video");
    data.set("rtpParameters", engine::toJson(mediarelay::test::h264Parameters()));

    auto result = request("a", "produce", data);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::ProduceError);
    EXPECT_TRUE(sessions_.findProducer("a").isError());
}

// =============================================================================
// Consume
// =============================================================================

TEST_F(SignalingHandlerTest, ConsumeBeforeCapabilitiesIsPrecondition) {
    connect("a");
    connect("b");
    std::string producerId = startProducing("a");
    ASSERT_TRUE(request("b", "createConsumerTransport").isSuccess());

    auto result = consume("b", producerId);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::PreconditionFailed);
}

TEST_F(SignalingHandlerTest, ConsumeWithoutTransportIsPrecondition) {
    connect("a");
    connect("b");
    std::string producerId = startProducing("a");
    negotiate("b");

    auto result = consume("b", producerId);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::PreconditionFailed);
}

TEST_F(SignalingHandlerTest, ConsumeUnknownProducerIsNotFound) {
    connect("b");
    prepareConsumer("b");

    auto result = consume("b", "producer-missing");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::NotFound);
    EXPECT_EQ(engine_->consumeCalls(), 0);
}

TEST_F(SignalingHandlerTest, ConsumeCreatesPausedConsumer) {
    connect("a");
    connect("b");
    std::string producerId = startProducing("a");
    prepareConsumer("b");

    auto result = consume("b", producerId);

    ASSERT_TRUE(result.isSuccess());
    const std::string consumerId = result.value()["id"].getString();
    EXPECT_EQ(result.value()["producerId"].getString(), producerId);
    EXPECT_EQ(result.value()["kind"].getString(), "video");
    EXPECT_TRUE(result.value()["rtpParameters"].isObject());
    EXPECT_TRUE(engine_->isConsumerPaused(consumerId));

    auto record = sessions_.findConsumer("b", consumerId);
    ASSERT_TRUE(record.isSuccess());
    EXPECT_TRUE(record.value().paused);
}

TEST_F(SignalingHandlerTest, IncompatibleConsumeCreatesNoRecord) {
    connect("a");
    connect("b");
    std::string producerId = startProducing("a");
    negotiate("b", mediarelay::test::audioOnlyCapabilities());
    ASSERT_TRUE(request("b", "createConsumerTransport").isSuccess());

    auto result = consume("b", producerId);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::ConsumeError);
    EXPECT_TRUE(sessions_.consumersOf("b").empty());
    EXPECT_EQ(engine_->consumerCount(), 0u);
}

TEST_F(SignalingHandlerTest, ResumeConsumer) {
    connect("a");
    connect("b");
    std::string producerId = startProducing("a");
    prepareConsumer("b");
    auto consumed = consume("b", producerId);
    ASSERT_TRUE(consumed.isSuccess());
    const std::string consumerId = consumed.value()["id"].getString();

    core::JsonValue data = core::JsonValue::object();
    data.set("consumerId", consumerId);
    auto result = request("b", "resumeConsumer", data);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_FALSE(engine_->isConsumerPaused(consumerId));
    EXPECT_FALSE(sessions_.findConsumer("b", consumerId).value().paused);
}

TEST_F(SignalingHandlerTest, ResumeOtherClientsConsumerIsNotFound) {
    connect("a");
    connect("b");
    connect("c");
    std::string producerId = startProducing("a");
    prepareConsumer("b");
    auto consumed = consume("b", producerId);
    ASSERT_TRUE(consumed.isSuccess());

    core::JsonValue data = core::JsonValue::object();
    data.set("consumerId", consumed.value()["id"].getString());
    auto result = request("c", "resumeConsumer", data);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::NotFound);
}

// =============================================================================
// Discovery
// =============================================================================

TEST_F(SignalingHandlerTest, ProducerListExcludesCaller) {
    connect("a");
    connect("b");
    connect("c");
    std::string fromA = startProducing("a");
    std::string fromB = startProducing("b");

    auto forA = request("a", "getProducers");
    auto forC = request("c", "getProducers");

    ASSERT_TRUE(forA.isSuccess());
    const core::JsonValue& listA = forA.value()["producerList"];
    ASSERT_EQ(listA.size(), 1u);
    EXPECT_EQ(listA.at(0)["producerId"].getString(), fromB);
    EXPECT_EQ(listA.at(0)["clientId"].getString(), "b");

    ASSERT_TRUE(forC.isSuccess());
    const core::JsonValue& listC = forC.value()["producerList"];
    ASSERT_EQ(listC.size(), 2u);
    EXPECT_EQ(listC.at(0)["producerId"].getString(), fromA);
    EXPECT_EQ(listC.at(1)["producerId"].getString(), fromB);
}

TEST_F(SignalingHandlerTest, HealthCheckCounts) {
    connect("a");
    connect("b");
    startProducing("a");

    auto result = request("a", "healthCheck");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value()["status"].getString(), "ok");
    EXPECT_EQ(result.value()["clients"].getInt(), 2);
    EXPECT_EQ(result.value()["producers"].getInt(), 1);
    EXPECT_EQ(result.value()["streams"].getInt(), 0);
}

TEST_F(SignalingHandlerTest, UnknownMethodIsNotFound) {
    connect("a");

    auto result = request("a", "teleport");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::NotFound);
}

// =============================================================================
// Disconnect
// =============================================================================

TEST_F(SignalingHandlerTest, DisconnectReleasesEverythingAndNotifies) {
    connect("a");
    connect("b");
    std::string producerId = startProducing("a");
    prepareConsumer("b");
    auto consumed = consume("b", producerId);
    ASSERT_TRUE(consumed.isSuccess());

    handler_->onDisconnect("a");

    EXPECT_FALSE(clients_.contains("a"));
    EXPECT_FALSE(sessions_.hasClient("a"));
    EXPECT_FALSE(engine_->hasProducer(producerId));
    EXPECT_FALSE(engine_->hasConsumer(consumed.value()["id"].getString()));
    EXPECT_TRUE(sessions_.consumersOf("b").empty());
    EXPECT_EQ(engine_->transportCount(), 1u);

    auto names = eventNames("b");
    ASSERT_FALSE(names.empty());
    EXPECT_EQ(names.back(), "producerClosed");
    EXPECT_EQ(events_["b"].back().second["producerId"].getString(), producerId);

    ASSERT_EQ(streams_.removedClients().size(), 1u);
    EXPECT_EQ(streams_.removedClients()[0], "a");
}

TEST_F(SignalingHandlerTest, DisconnectWithoutProducerSendsNoEvent) {
    connect("a");
    connect("b");
    ASSERT_TRUE(request("a", "createConsumerTransport").isSuccess());

    handler_->onDisconnect("a");

    EXPECT_EQ(eventNames("b"), std::vector<std::string>{"connected"});
    EXPECT_EQ(engine_->transportCount(), 0u);
}

TEST_F(SignalingHandlerTest, ConsumerSideDisconnectKeepsProducer) {
    connect("a");
    connect("b");
    std::string producerId = startProducing("a");
    prepareConsumer("b");
    ASSERT_TRUE(consume("b", producerId).isSuccess());

    handler_->onDisconnect("b");

    EXPECT_TRUE(engine_->hasProducer(producerId));
    EXPECT_EQ(engine_->consumerCount(), 0u);
    EXPECT_TRUE(sessions_.findProducer("a").isSuccess());
}

TEST_F(SignalingHandlerTest, ReconnectedClientStartsFresh) {
    connect("a");
    startProducing("a");
    handler_->onDisconnect("a");
    events_.clear();

    connect("a");

    EXPECT_TRUE(request("a", "createProducerTransport").isSuccess());
}

// =============================================================================
// Producer / Consumer Scenario
// =============================================================================

TEST_F(SignalingHandlerTest, LateJoinerDiscoversAndConsumesExistingProducer) {
    connect("a");
    negotiate("a");
    std::string producerId = startProducing("a");

    connect("b");
    prepareConsumer("b");
    auto producers = request("b", "getProducers");
    ASSERT_TRUE(producers.isSuccess());
    ASSERT_EQ(producers.value()["producerList"].size(), 1u);
    std::string discovered = producers.value()["producerList"].at(0)["producerId"].getString();
    EXPECT_EQ(discovered, producerId);

    auto consumed = consume("b", discovered);
    ASSERT_TRUE(consumed.isSuccess());
    core::JsonValue resume = core::JsonValue::object();
    resume.set("consumerId", consumed.value()["id"].getString());
    ASSERT_TRUE(request("b", "resumeConsumer", resume).isSuccess());

    handler_->onDisconnect("a");

    EXPECT_EQ(engine_->consumerCount(), 0u);
    EXPECT_EQ(eventNames("b").back(), "producerClosed");
    auto after = request("b", "getProducers");
    ASSERT_TRUE(after.isSuccess());
    EXPECT_EQ(after.value()["producerList"].size(), 0u);
}

// =============================================================================
// Broadcast
// =============================================================================

TEST_F(SignalingHandlerTest, StartStreamForwardsKeyAndReturnsPlaylist) {
    connect("a");
    core::JsonValue data = core::JsonValue::object();
    data.set("streamId", "lobby");

    auto result = request("a", "startHLSStream", data);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_TRUE(result.value()["success"].getBool());
    EXPECT_EQ(result.value()["streamId"].getString(), "lobby");
    EXPECT_EQ(result.value()["playlistUrl"].getString(), "/api/hls/lobby/playlist.m3u8");
    ASSERT_EQ(streams_.starts().size(), 1u);
    EXPECT_EQ(streams_.starts()[0].first, "lobby");
    EXPECT_EQ(streams_.starts()[0].second, "a");
}

TEST_F(SignalingHandlerTest, StartStreamWithoutKeyPassesEmptyKey) {
    connect("a");

    auto result = request("a", "startHLSStream");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(streams_.starts()[0].first, "");
    EXPECT_FALSE(result.value()["streamId"].getString().empty());
}

TEST_F(SignalingHandlerTest, StartStreamRejectsNonStringKey) {
    connect("a");
    core::JsonValue data = core::JsonValue::object();
    data.set("streamId", 17);

    auto result = request("a", "startHLSStream", data);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::InvalidArgument);
    EXPECT_TRUE(streams_.starts().empty());
}

TEST_F(SignalingHandlerTest, StartStreamRejectsPathLikeKeys) {
    int recordersCreated = 0;
    streaming::StreamLifecycleManager streams(sessions_, clients_,
        [&recordersCreated](const core::StreamKey&) -> std::shared_ptr<streaming::RecordingBridge> {
            ++recordersCreated;
            return nullptr;
        });
    SignalingHandler handler(sessions_, clients_, *facade_, streams);
    connect("a");
    ASSERT_FALSE(startProducing("a").empty());

    for (const char* key : {"/var/www", "../../etc", "lobby/../../x"}) {
        core::JsonValue data = core::JsonValue::object();
        data.set("streamId", key);

        auto result = handler.handleRequest("a", "startHLSStream", data);

        ASSERT_TRUE(result.isError()) << key;
        EXPECT_EQ(result.error().code, core::ErrorCode::InvalidArgument) << key;
    }
    EXPECT_EQ(streams.streamCount(), 0u);
    EXPECT_EQ(recordersCreated, 0);
}

TEST_F(SignalingHandlerTest, StartStreamFailureIsReported) {
    connect("a");
    streams_.failStart = core::Error{core::ErrorCode::RecorderStartFailed, "encoder exited"};

    auto result = request("a", "startHLSStream");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::RecorderStartFailed);
}

TEST_F(SignalingHandlerTest, StopStreamNeedsKey) {
    connect("a");

    auto missing = request("a", "stopHLSStream");
    core::JsonValue data = core::JsonValue::object();
    data.set("streamId", "lobby");
    auto stopped = request("a", "stopHLSStream", data);

    ASSERT_TRUE(missing.isError());
    EXPECT_EQ(missing.error().code, core::ErrorCode::InvalidArgument);
    ASSERT_TRUE(stopped.isSuccess());
    ASSERT_EQ(streams_.stops().size(), 1u);
    EXPECT_EQ(streams_.stops()[0].first, "lobby");
}

TEST_F(SignalingHandlerTest, ActiveStreamsListing) {
    connect("a");
    streaming::StreamInfo info;
    info.streamKey = "lobby";
    info.playbackUrl = "/api/hls/lobby/playlist.m3u8";
    info.members = {"a", "b"};
    info.isLive = true;
    streams_.streams.push_back(info);

    auto result = request("a", "getActiveStreams");

    ASSERT_TRUE(result.isSuccess());
    const core::JsonValue& list = result.value()["streams"];
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list.at(0)["streamId"].getString(), "lobby");
    EXPECT_EQ(list.at(0)["playlistUrl"].getString(), "/api/hls/lobby/playlist.m3u8");
    EXPECT_EQ(list.at(0)["streamers"].size(), 2u);
    EXPECT_TRUE(list.at(0)["isLive"].getBool());
}

// =============================================================================
// Text Envelopes
// =============================================================================

TEST_F(SignalingHandlerTest, HandleTextAnswersRequest) {
    connect("a");

    auto reply = handler_->handleText("a", serializeRequest(5, "healthCheck", core::JsonValue::object()));

    ASSERT_TRUE(reply.has_value());
    auto parsed = core::JsonValue::parse(*reply);
    ASSERT_TRUE(parsed.isSuccess());
    EXPECT_EQ(parsed.value()["type"].getString(), "response");
    EXPECT_EQ(parsed.value()["id"].getInt(), 5);
    EXPECT_EQ(parsed.value()["data"]["status"].getString(), "ok");
}

TEST_F(SignalingHandlerTest, HandleTextAnswersFailedRequestWithError) {
    connect("a");

    auto reply = handler_->handleText("a", serializeRequest(6, "consume", core::JsonValue::object()));

    ASSERT_TRUE(reply.has_value());
    auto parsed = core::JsonValue::parse(*reply);
    ASSERT_TRUE(parsed.isSuccess());
    EXPECT_EQ(parsed.value()["id"].getInt(), 6);
    EXPECT_EQ(parsed.value()["data"]["code"].getString(), "InvalidArgument");
    EXPECT_FALSE(parsed.value()["data"]["error"].getString().empty());
}

TEST_F(SignalingHandlerTest, HandleTextMalformedWithIdGetsErrorReply) {
    connect("a");

    auto reply = handler_->handleText("a", R"({"type":"bogus","id":9})");

    ASSERT_TRUE(reply.has_value());
    auto parsed = core::JsonValue::parse(*reply);
    ASSERT_TRUE(parsed.isSuccess());
    EXPECT_EQ(parsed.value()["id"].getInt(), 9);
    EXPECT_EQ(parsed.value()["data"]["code"].getString(), "InvalidArgument");
}

TEST_F(SignalingHandlerTest, HandleTextMalformedWithoutIdIsDropped) {
    connect("a");

    EXPECT_FALSE(handler_->handleText("a", "not json").has_value());
}

TEST_F(SignalingHandlerTest, NotifyHasNoReply) {
    connect("a");
    ASSERT_TRUE(request("a", "rtpCapabilities").isSuccess());
    core::JsonValue data = core::JsonValue::object();
    data.set("rtpCapabilities", engine::toJson(mediarelay::test::fullBrowserCapabilities()));

    auto reply = handler_->handleText("a", serializeNotify("setRtpCapabilities", data));

    EXPECT_FALSE(reply.has_value());
    EXPECT_TRUE(sessions_.capabilities("a").isSuccess());
}

} // namespace test
} // namespace protocol
} // namespace mediarelay
