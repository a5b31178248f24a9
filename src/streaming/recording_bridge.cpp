// MediaRelay - WebRTC SFU Signaling Server
// Recording Bridge Implementation

#include "mediarelay/streaming/recording_bridge.hpp"

#include "mediarelay/core/path_utils.hpp"
#include "mediarelay/streaming/hls_encoder_command.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace mediarelay {
namespace streaming {

namespace {

const char* LOG_CATEGORY = "Recorder";
const char* TAP_LISTEN_IP = "127.0.0.1";

constexpr std::chrono::milliseconds ENCODER_STOP_GRACE{3000};

std::string describeExit(const pal::ProcessExit& exit) {
    if (exit.signal != 0) {
        return "killed by signal " + std::to_string(exit.signal);
    }
    return "exit code " + std::to_string(exit.exitCode);
}

} // namespace

const char* recorderStateToString(RecorderState state) {
    switch (state) {
        case RecorderState::Idle: return "idle";
        case RecorderState::TapCreated: return "tap_created";
        case RecorderState::AwaitingEncoderReady: return "awaiting_encoder_ready";
        case RecorderState::Connected: return "connected";
        case RecorderState::Recording: return "recording";
        case RecorderState::Stopped: return "stopped";
    }
    return "unknown";
}

// =============================================================================
// Construction
// =============================================================================

std::shared_ptr<RecordingBridge> RecordingBridge::create(
    core::StreamKey streamKey,
    RecordingEnvironment environment
) {
    return std::shared_ptr<RecordingBridge>(
        new RecordingBridge(std::move(streamKey), std::move(environment)));
}

RecordingBridge::RecordingBridge(core::StreamKey streamKey, RecordingEnvironment environment)
    : streamKey_(std::move(streamKey))
    , env_(std::move(environment))
    , outputDirectory_((std::filesystem::path(env_.config.outputRoot) / streamKey_).string())
{
}

RecordingBridge::~RecordingBridge() {
    teardown();
}

// =============================================================================
// Start
// =============================================================================

core::Result<void, RecorderError> RecordingBridge::start(
    const std::vector<session::ProducerRecord>& videoProducers
) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != RecorderState::Idle) {
            return core::Result<void, RecorderError>::error(
                RecorderError{RecorderError::Code::InvalidState,
                              std::string("Recorder is ") + recorderStateToString(state_)});
        }
    }

    if (videoProducers.empty()) {
        return fail(RecorderError{RecorderError::Code::NoVideoProducer, "No video producers found"});
    }

    if (!outputDirectoryContained()) {
        return fail(RecorderError{RecorderError::Code::OutputFailed,
                                  "Output directory " + outputDirectory_ + " is outside " +
                                  env_.config.outputRoot});
    }

    // First found, not best quality
    const session::ProducerRecord& source = videoProducers.front();
    MEDIARELAY_LOG_INFO(env_.logger, LOG_CATEGORY,
        "Starting recording of " + streamKey_ + " from producer " + source.producerId);

    auto tap = env_.engine->openPassiveTap(TAP_LISTEN_IP);
    if (tap.isError()) {
        return fail(RecorderError{RecorderError::Code::TapFailed,
                                  "Passive tap: " + tap.error().message});
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tap_ = tap.value();
        sourceProducerId_ = source.producerId;
    }

    auto consumer = env_.engine->tapConsume(tap.value().transportId, source.producerId);
    if (consumer.isError()) {
        return fail(RecorderError{RecorderError::Code::TapFailed,
                                  "Tap consumer: " + consumer.error().message});
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        consumer_ = consumer.value();
        state_ = RecorderState::TapCreated;
    }

    std::error_code ec;
    std::filesystem::create_directories(outputDirectory_, ec);
    if (ec) {
        return fail(RecorderError{RecorderError::Code::OutputFailed,
                                  "Cannot create " + outputDirectory_ + ": " + ec.message()});
    }

    auto port = env_.ports->acquire();
    if (!port) {
        return fail(RecorderError{RecorderError::Code::PortUnavailable,
                                  "No free encoder RTP port"});
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        encoderPort_ = *port;
    }

    const std::string sdpPath =
        (std::filesystem::path(outputDirectory_) / SESSION_DESCRIPTION_FILE_NAME).string();
    {
        std::ofstream sdp(sdpPath, std::ios::trunc);
        sdp << buildSessionDescription(consumer.value().rtpParameters, TAP_LISTEN_IP, *port,
                                       "MediaRelay " + streamKey_);
        if (!sdp) {
            return fail(RecorderError{RecorderError::Code::OutputFailed,
                                      "Cannot write " + sdpPath});
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == RecorderState::Stopped) {
            return core::Result<void, RecorderError>::error(
                RecorderError{RecorderError::Code::InvalidState, "Recorder stopped during startup"});
        }
        state_ = RecorderState::AwaitingEncoderReady;
        encoderExited_ = false;
    }

    std::weak_ptr<RecordingBridge> weak = shared_from_this();
    auto spawned = env_.processes->spawn(
        buildEncoderCommand(env_.config, outputDirectory_, sdpPath),
        [weak](const std::string& line) {
            if (auto self = weak.lock()) {
                self->onEncoderLine(line);
            }
        },
        [weak](const pal::ProcessExit& exit) {
            if (auto self = weak.lock()) {
                self->onEncoderExit(exit);
            }
        });
    if (spawned.isError()) {
        return fail(RecorderError{RecorderError::Code::SpawnFailed,
                                  "Encoder launch: " + spawned.error().message});
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        process_ = spawned.value();
    }

    auto ready = awaitEncoderReady(*port);
    if (ready.isError()) {
        return fail(ready.error());
    }

    // The encoder listens: now the tap may send, and only then may the
    // consumer start producing packets
    auto connected = env_.engine->connectTap(tap.value().transportId, TAP_LISTEN_IP, *port);
    if (connected.isError()) {
        return fail(RecorderError{RecorderError::Code::ConnectFailed,
                                  "Tap connect: " + connected.error().message});
    }

    auto resumed = env_.engine->resumeConsumer(consumer.value().id);
    if (resumed.isError()) {
        return fail(RecorderError{RecorderError::Code::ConnectFailed,
                                  "Tap consumer resume: " + resumed.error().message});
    }

    std::optional<std::string> exitDescription;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != RecorderState::AwaitingEncoderReady) {
            return core::Result<void, RecorderError>::error(
                RecorderError{RecorderError::Code::InvalidState, "Recorder stopped during startup"});
        }
        // An exit while connecting was only recorded; nothing tore down yet
        if (encoderExited_) {
            exitDescription = describeExit(exitInfo_);
        } else {
            state_ = RecorderState::Connected;
        }
    }
    if (exitDescription) {
        return fail(RecorderError{RecorderError::Code::EncoderExited,
                                  "Encoder exited during startup (" + *exitDescription + ")"});
    }

    MEDIARELAY_LOG_INFO(env_.logger, LOG_CATEGORY,
        "HLS recording pipeline established for " + streamKey_ + " (encoder port " +
        std::to_string(*port) + ")");
    scheduleFileCheck();
    return core::Result<void, RecorderError>::success();
}

core::Result<void, RecorderError> RecordingBridge::awaitEncoderReady(uint16_t port) {
    const auto timeout = std::chrono::milliseconds(env_.config.readinessTimeoutMs);
    const auto poll = std::chrono::milliseconds(env_.config.readinessPollMs);
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        pal::ProcessHandle process;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == RecorderState::Stopped) {
                return core::Result<void, RecorderError>::error(
                    RecorderError{RecorderError::Code::InvalidState, "Recorder stopped during startup"});
            }
            if (encoderExited_) {
                return core::Result<void, RecorderError>::error(
                    RecorderError{RecorderError::Code::EncoderExited,
                                  "Encoder exited during startup (" + describeExit(exitInfo_) + ")"});
            }
            process = process_;
        }

        if (!env_.processes->isAlive(process)) {
            return core::Result<void, RecorderError>::error(
                RecorderError{RecorderError::Code::EncoderExited, "Encoder exited during startup"});
        }

        if (env_.portWatcher->isListening(port)) {
            return core::Result<void, RecorderError>::success();
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return core::Result<void, RecorderError>::error(
                RecorderError{RecorderError::Code::EncoderNotReady,
                              "Encoder did not listen on port " + std::to_string(port) + " within " +
                              std::to_string(env_.config.readinessTimeoutMs) + " ms"});
        }

        env_.threads->sleepFor(poll);
    }
}

bool RecordingBridge::outputDirectoryContained() const {
    std::error_code ec;
    std::filesystem::path root = std::filesystem::weakly_canonical(env_.config.outputRoot, ec);
    if (ec) {
        return false;
    }
    std::filesystem::path directory = std::filesystem::weakly_canonical(outputDirectory_, ec);
    if (ec) {
        return false;
    }
    if (root.has_relative_path() && root.filename().empty()) {
        root = root.parent_path();
    }
    if (directory.has_relative_path() && directory.filename().empty()) {
        directory = directory.parent_path();
    }
    return directory != root && core::isPathWithin(root, directory);
}

core::Result<void, RecorderError> RecordingBridge::fail(RecorderError error) {
    if (env_.logger) {
        core::LogContext context;
        context.streamKey = streamKey_;
        context.errorCode = static_cast<int32_t>(core::ErrorCode::RecorderStartFailed);
        env_.logger->errorWithContext("Recorder start failed: " + error.message, context, LOG_CATEGORY);
    }
    teardown();
    return core::Result<void, RecorderError>::error(std::move(error));
}

// =============================================================================
// Stop
// =============================================================================

void RecordingBridge::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == RecorderState::Idle) {
            state_ = RecorderState::Stopped;
            return;
        }
    }
    teardown();
}

void RecordingBridge::teardown() {
    std::optional<engine::PassiveTap> tap;
    std::optional<engine::ConsumerHandle> consumer;
    pal::ProcessHandle process{pal::INVALID_PROCESS_HANDLE};
    pal::TimerHandle timer{pal::INVALID_TIMER_HANDLE};
    uint16_t port = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = RecorderState::Stopped;
        tap.swap(tap_);
        consumer.swap(consumer_);
        std::swap(process, process_);
        std::swap(timer, fileCheckTimer_);
        std::swap(port, encoderPort_);
    }

    if (!tap && !consumer && process == pal::INVALID_PROCESS_HANDLE && port == 0) {
        return;
    }

    if (timer != pal::INVALID_TIMER_HANDLE && env_.timers != nullptr) {
        auto cancelled = env_.timers->cancelTimer(timer);
        if (cancelled.isError()) {
            MEDIARELAY_LOG_DEBUG(env_.logger, LOG_CATEGORY,
                "File check timer already gone: " + cancelled.error().message);
        }
    }

    if (process != pal::INVALID_PROCESS_HANDLE) {
        auto terminated = env_.processes->terminate(process, ENCODER_STOP_GRACE);
        if (terminated.isError()) {
            MEDIARELAY_LOG_WARNING(env_.logger, LOG_CATEGORY,
                "Failed to terminate encoder of " + streamKey_ + ": " + terminated.error().message);
        }
    }
    if (consumer) {
        env_.engine->closeConsumer(consumer->id);
    }
    if (tap) {
        env_.engine->closeTransport(tap->transportId);
    }
    if (port != 0) {
        env_.ports->release(port);
    }

    MEDIARELAY_LOG_INFO(env_.logger, LOG_CATEGORY, "HLS recording cleanup completed for " + streamKey_);
}

// =============================================================================
// Encoder Callbacks
// =============================================================================

void RecordingBridge::onEncoderLine(const std::string& line) {
    switch (classifyEncoderLine(line)) {
        case EncoderLineKind::Progress: {
            bool first = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (state_ == RecorderState::Connected) {
                    state_ = RecorderState::Recording;
                    first = true;
                }
            }
            if (first) {
                MEDIARELAY_LOG_INFO(env_.logger, LOG_CATEGORY,
                    "Encoder started processing frames for " + streamKey_);
            }
            break;
        }
        case EncoderLineKind::Error:
            MEDIARELAY_LOG_ERROR(env_.logger, LOG_CATEGORY, "Encoder [" + streamKey_ + "]: " + line);
            break;
        case EncoderLineKind::StreamInfo:
            MEDIARELAY_LOG_DEBUG(env_.logger, LOG_CATEGORY, "Encoder [" + streamKey_ + "]: " + line);
            break;
        case EncoderLineKind::Other:
            break;
    }
}

void RecordingBridge::onEncoderExit(const pal::ProcessExit& exit) {
    bool wasRunning = false;
    RecorderFailureCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        encoderExited_ = true;
        exitInfo_ = exit;
        if (state_ == RecorderState::Connected || state_ == RecorderState::Recording) {
            wasRunning = true;
            callback = failureCallback_;
        }
    }

    const std::string reason = describeExit(exit);
    if (!wasRunning) {
        // Either a requested stop or startup, which notices on its own
        MEDIARELAY_LOG_DEBUG(env_.logger, LOG_CATEGORY,
            "Encoder of " + streamKey_ + " closed with " + reason);
        return;
    }

    MEDIARELAY_LOG_ERROR(env_.logger, LOG_CATEGORY,
        "Encoder of " + streamKey_ + " exited while recording (" + reason + ")");
    teardown();
    if (callback) {
        callback(streamKey_, reason);
    }
}

// =============================================================================
// Accessors
// =============================================================================

void RecordingBridge::setFailureCallback(RecorderFailureCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    failureCallback_ = std::move(callback);
}

RecorderState RecordingBridge::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool RecordingBridge::isActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == RecorderState::Connected || state_ == RecorderState::Recording;
}

std::string RecordingBridge::playbackUrl() const {
    return env_.playbackPathPrefix + "/" + streamKey_ + "/" + PLAYLIST_FILE_NAME;
}

std::string RecordingBridge::outputDirectory() const {
    return outputDirectory_;
}

core::ProducerId RecordingBridge::sourceProducerId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sourceProducerId_;
}

OutputFileStatus RecordingBridge::checkFiles() const {
    OutputFileStatus status;
    status.outputPath = outputDirectory_;
    status.playlistPath = (std::filesystem::path(outputDirectory_) / PLAYLIST_FILE_NAME).string();

    std::error_code ec;
    status.playlistExists = std::filesystem::exists(status.playlistPath, ec);

    std::filesystem::directory_iterator it(outputDirectory_, ec);
    if (!ec) {
        for (const auto& entry : it) {
            if (entry.path().extension() == ".ts") {
                status.hasSegments = true;
                break;
            }
        }
    }
    return status;
}

void RecordingBridge::scheduleFileCheck() {
    if (env_.timers == nullptr || env_.config.fileCheckDelayMs == 0) {
        return;
    }

    std::weak_ptr<RecordingBridge> weak = shared_from_this();
    auto scheduled = env_.timers->scheduleOnce(
        std::chrono::milliseconds(env_.config.fileCheckDelayMs),
        [weak]() {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            OutputFileStatus status = self->checkFiles();
            MEDIARELAY_LOG_INFO(self->env_.logger, LOG_CATEGORY,
                "HLS file status for " + self->streamKey_ +
                ": playlist=" + (status.playlistExists ? "yes" : "no") +
                " segments=" + (status.hasSegments ? "yes" : "no") +
                " path=" + status.outputPath);
        });

    if (scheduled.isError()) {
        MEDIARELAY_LOG_WARNING(env_.logger, LOG_CATEGORY,
            "Cannot schedule HLS file check: " + scheduled.error().message);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    fileCheckTimer_ = scheduled.value();
}

} // namespace streaming
} // namespace mediarelay
