// MediaRelay - WebRTC SFU Signaling Server
// Tests for Recording Bridge
//
// Tests cover:
// - Pipeline order: tap, paused consumer, encoder, readiness, connect, resume
// - Startup failures releasing everything they created
// - Stop and encoder exit teardown
// - Output directory and file check

#include <gtest/gtest.h>
#include "mediarelay/streaming/recording_bridge.hpp"
#include "mediarelay/streaming/hls_encoder_command.hpp"
#include "support/fake_process_pal.hpp"
#include "support/fake_port_watcher.hpp"
#include "support/fake_scheduling_pal.hpp"
#include "support/mock_media_engine.hpp"
#include "support/rtp_fixtures.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace mediarelay {
namespace streaming {
namespace test {

namespace fs = std::filesystem;

using mediarelay::test::FakeProcessPAL;
using mediarelay::test::FakePortWatcher;
using mediarelay::test::FakeTimerPAL;
using mediarelay::test::InlineThreadPAL;
using mediarelay::test::MockMediaEngine;

class RecordingBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        outputRoot_ = fs::temp_directory_path() /
            ("mediarelay_recorder_test_" + std::to_string(::getpid()));
        fs::remove_all(outputRoot_);

        engine_ = std::make_shared<MockMediaEngine>();
        facade_ = std::make_unique<engine::EngineFacade>(engine_);
        ports_ = std::make_unique<EncoderPortPool>(50000, 50009, portWatcher_);
        readiness_.setListenAll(true);

        environment_.engine = facade_.get();
        environment_.processes = &processes_;
        environment_.threads = &threads_;
        environment_.timers = &timers_;
        environment_.portWatcher = &readiness_;
        environment_.ports = ports_.get();
        environment_.config.outputRoot = outputRoot_.string();
        environment_.config.encoderPath = "ffmpeg";
        environment_.config.readinessTimeoutMs = 200;
        environment_.config.readinessPollMs = 1;
        environment_.config.fileCheckDelayMs = 5000;
        environment_.playbackPathPrefix = "/api/hls";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(outputRoot_, ec);
    }

    /**
     * @brief A video producer on its own transport, as a browser would create.
     */
    session::ProducerRecord videoProducer(const std::string& clientId = "alice") {
        auto transport = facade_->openTransport(core::TransportRole::Producing);
        EXPECT_TRUE(transport.isSuccess());
        auto producer = facade_->produce(transport.value().id, core::MediaKind::Video,
                                         mediarelay::test::h264Parameters());
        EXPECT_TRUE(producer.isSuccess());

        session::ProducerRecord record;
        record.producerId = producer.value().id;
        record.kind = core::MediaKind::Video;
        record.clientId = clientId;
        return record;
    }

    std::shared_ptr<RecordingBridge> makeBridge(const std::string& key = "lobby") {
        return RecordingBridge::create(key, environment_);
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream content;
        content << in.rdbuf();
        return content.str();
    }

    fs::path outputRoot_;
    std::shared_ptr<MockMediaEngine> engine_;
    std::unique_ptr<engine::EngineFacade> facade_;
    FakePortWatcher portWatcher_;
    FakePortWatcher readiness_;
    std::unique_ptr<EncoderPortPool> ports_;
    FakeProcessPAL processes_;
    InlineThreadPAL threads_;
    FakeTimerPAL timers_;
    RecordingEnvironment environment_;
};

// =============================================================================
// Successful Start
// =============================================================================

TEST_F(RecordingBridgeTest, StartBuildsPipeline) {
    session::ProducerRecord producer = videoProducer();
    auto bridge = makeBridge();

    auto started = bridge->start({producer});

    ASSERT_TRUE(started.isSuccess()) << started.error().message;
    EXPECT_EQ(bridge->state(), RecorderState::Connected);
    EXPECT_TRUE(bridge->isActive());
    EXPECT_EQ(bridge->sourceProducerId(), producer.producerId);

    // producer transport + tap
    EXPECT_EQ(engine_->transportCount(), 2u);
    EXPECT_EQ(engine_->consumerCount(), 1u);
    auto connections = engine_->plainConnections();
    ASSERT_EQ(connections.size(), 1u);
    EXPECT_EQ(connections[0].first, "127.0.0.1");
    EXPECT_EQ(connections[0].second, 50000);
    EXPECT_EQ(ports_->inUse(), 1u);
    EXPECT_EQ(processes_.spawnCount(), 1u);
}

TEST_F(RecordingBridgeTest, TapConsumerIsResumedAfterConnect) {
    auto bridge = makeBridge();

    ASSERT_TRUE(bridge->start({videoProducer()}).isSuccess());

    int found = 0;
    for (int i = 1; i <= 10; ++i) {
        const std::string id = "consumer-" + std::to_string(i);
        if (engine_->hasConsumer(id)) {
            ++found;
            EXPECT_FALSE(engine_->isConsumerPaused(id));
        }
    }
    EXPECT_EQ(found, 1);
}

TEST_F(RecordingBridgeTest, WritesSessionDescriptionForEncoderPort) {
    auto bridge = makeBridge();

    ASSERT_TRUE(bridge->start({videoProducer()}).isSuccess());

    fs::path sdpPath = fs::path(bridge->outputDirectory()) / SESSION_DESCRIPTION_FILE_NAME;
    ASSERT_TRUE(fs::exists(sdpPath));
    std::string sdp = readFile(sdpPath);
    EXPECT_NE(sdp.find("m=video 50000 RTP/AVP 125"), std::string::npos);
    EXPECT_NE(sdp.find("s=MediaRelay lobby"), std::string::npos);

    auto commands = processes_.commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].executable, "ffmpeg");
    EXPECT_EQ(commands[0].arguments.back(),
              (fs::path(bridge->outputDirectory()) / PLAYLIST_FILE_NAME).string());
}

TEST_F(RecordingBridgeTest, FirstVideoProducerIsRecorded) {
    session::ProducerRecord first = videoProducer("alice");
    session::ProducerRecord second = videoProducer("bob");
    auto bridge = makeBridge();

    ASSERT_TRUE(bridge->start({first, second}).isSuccess());

    EXPECT_EQ(bridge->sourceProducerId(), first.producerId);
}

TEST_F(RecordingBridgeTest, PlaybackLocatorAndOutputDirectory) {
    auto bridge = makeBridge("stream_1700000000000");

    EXPECT_EQ(bridge->playbackUrl(), "/api/hls/stream_1700000000000/playlist.m3u8");
    EXPECT_EQ(bridge->outputDirectory(), (outputRoot_ / "stream_1700000000000").string());
    EXPECT_EQ(bridge->state(), RecorderState::Idle);
}

TEST_F(RecordingBridgeTest, ProgressLineMarksRecording) {
    auto bridge = makeBridge();
    ASSERT_TRUE(bridge->start({videoProducer()}).isSuccess());

    processes_.emitLine(processes_.lastHandle(), "Stream #0:0: Video: h264");
    EXPECT_EQ(bridge->state(), RecorderState::Connected);

    processes_.emitLine(processes_.lastHandle(), "frame=   30 fps= 30 q=20.0 size=N/A");
    EXPECT_EQ(bridge->state(), RecorderState::Recording);
    EXPECT_TRUE(bridge->isActive());
}

TEST_F(RecordingBridgeTest, WaitsUntilEncoderListens) {
    readiness_.setListenAll(false);
    readiness_.setListening(50000);
    auto bridge = makeBridge();

    ASSERT_TRUE(bridge->start({videoProducer()}).isSuccess());

    EXPECT_GE(readiness_.queries(), 1);
}

TEST_F(RecordingBridgeTest, SecondStartIsRejected) {
    auto bridge = makeBridge();
    ASSERT_TRUE(bridge->start({videoProducer()}).isSuccess());

    auto again = bridge->start({videoProducer("bob")});

    ASSERT_TRUE(again.isError());
    EXPECT_EQ(again.error().code, RecorderError::Code::InvalidState);
    EXPECT_EQ(processes_.spawnCount(), 1u);
}

// =============================================================================
// Startup Failures
// =============================================================================

TEST_F(RecordingBridgeTest, NoVideoProducerFails) {
    auto bridge = makeBridge();

    auto started = bridge->start({});

    ASSERT_TRUE(started.isError());
    EXPECT_EQ(started.error().code, RecorderError::Code::NoVideoProducer);
    EXPECT_EQ(bridge->state(), RecorderState::Stopped);
    EXPECT_EQ(engine_->transportCount(), 0u);
    EXPECT_EQ(processes_.spawnCount(), 0u);
}

TEST_F(RecordingBridgeTest, ParentRelativeKeyCannotLeaveOutputRoot) {
    session::ProducerRecord producer = videoProducer();
    auto bridge = makeBridge("../escaped");

    auto started = bridge->start({producer});

    ASSERT_TRUE(started.isError());
    EXPECT_EQ(started.error().code, RecorderError::Code::OutputFailed);
    EXPECT_EQ(bridge->state(), RecorderState::Stopped);
    EXPECT_FALSE(fs::exists(outputRoot_.parent_path() / "escaped"));
    EXPECT_EQ(engine_->transportCount(), 1u);
    EXPECT_EQ(processes_.spawnCount(), 0u);
    EXPECT_EQ(ports_->inUse(), 0u);
}

TEST_F(RecordingBridgeTest, AbsoluteKeyCannotLeaveOutputRoot) {
    session::ProducerRecord producer = videoProducer();
    const fs::path elsewhere = outputRoot_.string() + "_elsewhere";
    auto bridge = makeBridge(elsewhere.string());

    auto started = bridge->start({producer});

    ASSERT_TRUE(started.isError());
    EXPECT_EQ(started.error().code, RecorderError::Code::OutputFailed);
    EXPECT_FALSE(fs::exists(elsewhere));
    EXPECT_EQ(processes_.spawnCount(), 0u);
}

TEST_F(RecordingBridgeTest, KeyNamingTheRootItselfIsRejected) {
    auto bridge = makeBridge(".");

    auto started = bridge->start({videoProducer()});

    ASSERT_TRUE(started.isError());
    EXPECT_EQ(started.error().code, RecorderError::Code::OutputFailed);
}

TEST_F(RecordingBridgeTest, TapFailureReleasesNothingElse) {
    session::ProducerRecord producer = videoProducer();
    engine_->failCreatePlain = engine::EngineError(engine::EngineError::Code::ResourceExhausted, "no ports");
    auto bridge = makeBridge();

    auto started = bridge->start({producer});

    ASSERT_TRUE(started.isError());
    EXPECT_EQ(started.error().code, RecorderError::Code::TapFailed);
    EXPECT_EQ(bridge->state(), RecorderState::Stopped);
    EXPECT_EQ(engine_->transportCount(), 1u);
    EXPECT_EQ(ports_->inUse(), 0u);
}

TEST_F(RecordingBridgeTest, TapConsumerFailureClosesTap) {
    session::ProducerRecord producer = videoProducer();
    engine_->failConsume = engine::EngineError(engine::EngineError::Code::InvalidParameters, "no codec");
    auto bridge = makeBridge();

    auto started = bridge->start({producer});

    ASSERT_TRUE(started.isError());
    EXPECT_EQ(started.error().code, RecorderError::Code::TapFailed);
    EXPECT_EQ(engine_->transportCount(), 1u);
    EXPECT_EQ(processes_.spawnCount(), 0u);
}

TEST_F(RecordingBridgeTest, NoFreeEncoderPort) {
    session::ProducerRecord producer = videoProducer();
    ports_ = std::make_unique<EncoderPortPool>(50000, 50000, portWatcher_);
    environment_.ports = ports_.get();
    auto bridge = makeBridge();

    auto started = bridge->start({producer});

    ASSERT_TRUE(started.isError());
    EXPECT_EQ(started.error().code, RecorderError::Code::PortUnavailable);
    EXPECT_EQ(engine_->transportCount(), 1u);
    EXPECT_EQ(engine_->consumerCount(), 0u);
}

TEST_F(RecordingBridgeTest, SpawnFailureReleasesTapAndPort) {
    session::ProducerRecord producer = videoProducer();
    processes_.failSpawn = pal::ProcessError(pal::ProcessErrorCode::InvalidCommand, "ffmpeg not found");
    auto bridge = makeBridge();

    auto started = bridge->start({producer});

    ASSERT_TRUE(started.isError());
    EXPECT_EQ(started.error().code, RecorderError::Code::SpawnFailed);
    EXPECT_NE(started.error().message.find("ffmpeg not found"), std::string::npos);
    EXPECT_EQ(engine_->transportCount(), 1u);
    EXPECT_EQ(engine_->consumerCount(), 0u);
    EXPECT_EQ(ports_->inUse(), 0u);
}

TEST_F(RecordingBridgeTest, EncoderExitingAtStartupFails) {
    session::ProducerRecord producer = videoProducer();
    pal::ProcessExit exit;
    exit.exitCode = 1;
    processes_.exitOnSpawn = exit;
    auto bridge = makeBridge();

    auto started = bridge->start({producer});

    ASSERT_TRUE(started.isError());
    EXPECT_EQ(started.error().code, RecorderError::Code::EncoderExited);
    EXPECT_NE(started.error().message.find("exit code 1"), std::string::npos);
    EXPECT_EQ(bridge->state(), RecorderState::Stopped);
    EXPECT_EQ(engine_->transportCount(), 1u);
    EXPECT_EQ(engine_->consumerCount(), 0u);
    EXPECT_EQ(ports_->inUse(), 0u);
    EXPECT_TRUE(engine_->plainConnections().empty());
}

TEST_F(RecordingBridgeTest, EncoderExitingBeforeConnectedFailsAndTearsDown) {
    session::ProducerRecord producer = videoProducer();
    auto bridge = makeBridge();
    bool failureReported = false;
    bridge->setFailureCallback([&](const core::StreamKey&, const std::string&) {
        failureReported = true;
    });
    // The encoder binds its port and dies right after
    readiness_.setOnQuery([this](uint16_t) {
        pal::ProcessExit exit;
        exit.exitCode = 1;
        processes_.exit(processes_.lastHandle(), exit);
    });

    auto started = bridge->start({producer});

    ASSERT_TRUE(started.isError());
    EXPECT_EQ(started.error().code, RecorderError::Code::EncoderExited);
    EXPECT_NE(started.error().message.find("exit code 1"), std::string::npos);
    EXPECT_EQ(bridge->state(), RecorderState::Stopped);
    EXPECT_FALSE(bridge->isActive());
    EXPECT_FALSE(failureReported);
    EXPECT_EQ(engine_->transportCount(), 1u);
    EXPECT_EQ(engine_->consumerCount(), 0u);
    EXPECT_EQ(ports_->inUse(), 0u);
    EXPECT_EQ(timers_.pendingCount(), 0u);
}

TEST_F(RecordingBridgeTest, RetryAfterFailedStartWorks) {
    session::ProducerRecord producer = videoProducer();
    pal::ProcessExit exit;
    exit.exitCode = 1;
    processes_.exitOnSpawn = exit;
    ASSERT_TRUE(makeBridge()->start({producer}).isError());

    processes_.exitOnSpawn.reset();
    auto retry = makeBridge();
    auto started = retry->start({producer});

    ASSERT_TRUE(started.isSuccess());
    EXPECT_EQ(retry->state(), RecorderState::Connected);
    EXPECT_EQ(ports_->inUse(), 1u);
}

TEST_F(RecordingBridgeTest, ReadinessTimeoutTerminatesEncoder) {
    session::ProducerRecord producer = videoProducer();
    readiness_.setListenAll(false);
    environment_.config.readinessTimeoutMs = 20;
    auto bridge = makeBridge();

    auto started = bridge->start({producer});

    ASSERT_TRUE(started.isError());
    EXPECT_EQ(started.error().code, RecorderError::Code::EncoderNotReady);
    EXPECT_EQ(processes_.terminateCount(), 1u);
    EXPECT_EQ(processes_.aliveCount(), 0u);
    EXPECT_GE(threads_.sleeps(), 1);
    EXPECT_TRUE(engine_->plainConnections().empty());
    EXPECT_EQ(engine_->transportCount(), 1u);
}

TEST_F(RecordingBridgeTest, TapConnectFailureTearsDown) {
    session::ProducerRecord producer = videoProducer();
    engine_->failConnectPlain = engine::EngineError(engine::EngineError::Code::Internal, "sendto failed");
    auto bridge = makeBridge();

    auto started = bridge->start({producer});

    ASSERT_TRUE(started.isError());
    EXPECT_EQ(started.error().code, RecorderError::Code::ConnectFailed);
    EXPECT_EQ(processes_.aliveCount(), 0u);
    EXPECT_EQ(engine_->consumerCount(), 0u);
    EXPECT_EQ(ports_->inUse(), 0u);
}

TEST_F(RecordingBridgeTest, ConsumerResumeFailureTearsDown) {
    session::ProducerRecord producer = videoProducer();
    engine_->failResumeConsumer = engine::EngineError(engine::EngineError::Code::Internal, "closed");
    auto bridge = makeBridge();

    auto started = bridge->start({producer});

    ASSERT_TRUE(started.isError());
    EXPECT_EQ(started.error().code, RecorderError::Code::ConnectFailed);
    EXPECT_EQ(engine_->transportCount(), 1u);
}

// =============================================================================
// Stop And Encoder Exit
// =============================================================================

TEST_F(RecordingBridgeTest, StopReleasesEverything) {
    auto bridge = makeBridge();
    ASSERT_TRUE(bridge->start({videoProducer()}).isSuccess());

    bridge->stop();

    EXPECT_EQ(bridge->state(), RecorderState::Stopped);
    EXPECT_FALSE(bridge->isActive());
    EXPECT_EQ(processes_.terminateCount(), 1u);
    EXPECT_EQ(engine_->transportCount(), 1u);
    EXPECT_EQ(engine_->consumerCount(), 0u);
    EXPECT_EQ(ports_->inUse(), 0u);
}

TEST_F(RecordingBridgeTest, StopTwiceIsNoOp) {
    auto bridge = makeBridge();
    ASSERT_TRUE(bridge->start({videoProducer()}).isSuccess());

    bridge->stop();
    bridge->stop();

    EXPECT_EQ(processes_.terminateCount(), 1u);
}

TEST_F(RecordingBridgeTest, StopBeforeStartPreventsStart) {
    auto bridge = makeBridge();

    bridge->stop();
    auto started = bridge->start({videoProducer()});

    EXPECT_EQ(bridge->state(), RecorderState::Stopped);
    ASSERT_TRUE(started.isError());
    EXPECT_EQ(started.error().code, RecorderError::Code::InvalidState);
}

TEST_F(RecordingBridgeTest, EncoderExitWhileRecordingReportsFailure) {
    auto bridge = makeBridge();
    std::string failedKey;
    std::string failedReason;
    bridge->setFailureCallback([&](const core::StreamKey& key, const std::string& reason) {
        failedKey = key;
        failedReason = reason;
    });
    ASSERT_TRUE(bridge->start({videoProducer()}).isSuccess());
    processes_.emitLine(processes_.lastHandle(), "frame=1 fps=0.0");

    pal::ProcessExit exit;
    exit.signal = 9;
    processes_.exit(processes_.lastHandle(), exit);

    EXPECT_EQ(failedKey, "lobby");
    EXPECT_EQ(failedReason, "killed by signal 9");
    EXPECT_EQ(bridge->state(), RecorderState::Stopped);
    EXPECT_EQ(engine_->transportCount(), 1u);
    EXPECT_EQ(ports_->inUse(), 0u);
}

TEST_F(RecordingBridgeTest, RequestedStopDoesNotReportFailure) {
    auto bridge = makeBridge();
    int failures = 0;
    bridge->setFailureCallback([&failures](const core::StreamKey&, const std::string&) { ++failures; });
    ASSERT_TRUE(bridge->start({videoProducer()}).isSuccess());

    bridge->stop();

    EXPECT_EQ(failures, 0);
}

TEST_F(RecordingBridgeTest, DestroyingBridgeReleasesResources) {
    {
        auto bridge = makeBridge();
        ASSERT_TRUE(bridge->start({videoProducer()}).isSuccess());
    }

    EXPECT_EQ(processes_.aliveCount(), 0u);
    EXPECT_EQ(engine_->consumerCount(), 0u);
    EXPECT_EQ(ports_->inUse(), 0u);
}

// =============================================================================
// Output Files
// =============================================================================

TEST_F(RecordingBridgeTest, FileCheckScheduledAndCancelledOnStop) {
    auto bridge = makeBridge();
    ASSERT_TRUE(bridge->start({videoProducer()}).isSuccess());

    ASSERT_EQ(timers_.pendingCount(), 1u);
    EXPECT_EQ(timers_.pendingDelays()[0], std::chrono::milliseconds(5000));

    bridge->stop();

    EXPECT_EQ(timers_.pendingCount(), 0u);
    EXPECT_EQ(timers_.cancelledCount(), 1);
}

TEST_F(RecordingBridgeTest, FileCheckFiringIsHarmless) {
    auto bridge = makeBridge();
    ASSERT_TRUE(bridge->start({videoProducer()}).isSuccess());

    EXPECT_EQ(timers_.fireAll(), 1u);

    bridge->stop();
    EXPECT_EQ(bridge->state(), RecorderState::Stopped);
}

TEST_F(RecordingBridgeTest, NoFileCheckWithoutTimers) {
    environment_.timers = nullptr;
    auto bridge = makeBridge();

    ASSERT_TRUE(bridge->start({videoProducer()}).isSuccess());

    EXPECT_EQ(timers_.pendingCount(), 0u);
}

TEST_F(RecordingBridgeTest, CheckFilesReportsPlaylistAndSegments) {
    auto bridge = makeBridge();
    ASSERT_TRUE(bridge->start({videoProducer()}).isSuccess());

    OutputFileStatus before = bridge->checkFiles();
    EXPECT_FALSE(before.playlistExists);
    EXPECT_FALSE(before.hasSegments);
    EXPECT_EQ(before.outputPath, bridge->outputDirectory());

    fs::path out(bridge->outputDirectory());
    std::ofstream(out / PLAYLIST_FILE_NAME) << "#EXTM3U\n";
    std::ofstream(out / "segment_000.ts") << "ts";

    OutputFileStatus after = bridge->checkFiles();
    EXPECT_TRUE(after.playlistExists);
    EXPECT_TRUE(after.hasSegments);
    EXPECT_EQ(after.playlistPath, (out / PLAYLIST_FILE_NAME).string());
}

TEST(RecorderStateTest, Names) {
    EXPECT_STREQ(recorderStateToString(RecorderState::Idle), "idle");
    EXPECT_STREQ(recorderStateToString(RecorderState::AwaitingEncoderReady), "awaiting_encoder_ready");
    EXPECT_STREQ(recorderStateToString(RecorderState::Recording), "recording");
    EXPECT_STREQ(recorderStateToString(RecorderState::Stopped), "stopped");
}

} // namespace test
} // namespace streaming
} // namespace mediarelay
