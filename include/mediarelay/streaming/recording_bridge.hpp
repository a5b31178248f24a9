// MediaRelay - WebRTC SFU Signaling Server
// Recording Bridge - RTP tap plus HLS encoder process for one stream
//
// Responsibilities:
// - Open a passive tap and a paused tap consumer on the first video producer
// - Launch the encoder and wait until it listens on its RTP input port
// - Connect the tap only then, and resume the consumer only after that
// - Tear tap, consumer and encoder down together on stop, startup failure or
//   encoder exit
// - Expose the playback locator and an output file check
//
// State machine:
//   Idle -> TapCreated -> AwaitingEncoderReady -> Connected -> Recording
//   any state -> Stopped

#ifndef MEDIARELAY_STREAMING_RECORDING_BRIDGE_HPP
#define MEDIARELAY_STREAMING_RECORDING_BRIDGE_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mediarelay/core/config_manager.hpp"
#include "mediarelay/core/result.hpp"
#include "mediarelay/core/structured_logger.hpp"
#include "mediarelay/core/types.hpp"
#include "mediarelay/engine/engine_facade.hpp"
#include "mediarelay/pal/process_pal.hpp"
#include "mediarelay/pal/thread_pal.hpp"
#include "mediarelay/pal/timer_pal.hpp"
#include "mediarelay/session/session_registry.hpp"
#include "mediarelay/streaming/encoder_port_pool.hpp"
#include "mediarelay/streaming/port_watcher.hpp"

namespace mediarelay {
namespace streaming {

// =============================================================================
// Types
// =============================================================================

enum class RecorderState {
    Idle,
    TapCreated,
    AwaitingEncoderReady,
    Connected,
    Recording,
    Stopped
};

const char* recorderStateToString(RecorderState state);

struct RecorderError {
    enum class Code {
        InvalidState,       ///< start() on a bridge that already ran
        NoVideoProducer,
        TapFailed,          ///< Passive tap or tap consumer could not be created
        OutputFailed,       ///< Output directory or SDP file not writable
        PortUnavailable,    ///< No free encoder input port
        SpawnFailed,
        EncoderExited,      ///< Encoder died before it was ready
        EncoderNotReady,    ///< Readiness timeout expired
        ConnectFailed       ///< Tap connect or consumer resume failed
    };

    Code code;
    std::string message;

    RecorderError(Code c = Code::SpawnFailed, std::string msg = "")
        : code(c), message(std::move(msg)) {}
};

/**
 * @brief Result of checking the encoder's output directory.
 */
struct OutputFileStatus {
    bool playlistExists = false;
    bool hasSegments = false;
    std::string outputPath;
    std::string playlistPath;
};

/**
 * @brief Invoked when the encoder dies after startup completed.
 */
using RecorderFailureCallback = std::function<void(const core::StreamKey& streamKey, const std::string& reason)>;

/**
 * @brief Collaborators shared by all recorders of a server.
 *
 * All pointers are non-owning and must outlive every recorder; timers may
 * be null to skip the delayed output check.
 */
struct RecordingEnvironment {
    engine::EngineFacade* engine = nullptr;
    pal::IProcessPAL* processes = nullptr;
    pal::IThreadPAL* threads = nullptr;
    pal::ITimerPAL* timers = nullptr;
    IPortWatcher* portWatcher = nullptr;
    EncoderPortPool* ports = nullptr;
    core::RecordingConfig config;
    std::string playbackPathPrefix = "/api/hls";
    std::shared_ptr<core::StructuredLogger> logger;
};

// =============================================================================
// Recording Bridge
// =============================================================================

/**
 * @brief One recorder; one per stream group at a time.
 *
 * A bridge runs once: after Stopped a new bridge is created for a retry.
 *
 * @code
 * auto bridge = RecordingBridge::create("stream_1700000000000", environment);
 * auto started = bridge->start(registry.videoProducers());
 * if (started.isError()) {
 *     // bridge is Stopped, everything it created is released
 * }
 * ...
 * bridge->stop();
 * @endcode
 *
 * Thread Safety: public methods are thread-safe. Encoder callbacks arrive on
 * the process PAL's reader thread.
 */
class RecordingBridge : public std::enable_shared_from_this<RecordingBridge> {
public:
    static std::shared_ptr<RecordingBridge> create(core::StreamKey streamKey, RecordingEnvironment environment);

    ~RecordingBridge();

    RecordingBridge(const RecordingBridge&) = delete;
    RecordingBridge& operator=(const RecordingBridge&) = delete;

    /**
     * @brief Build the pipeline on the first video producer.
     *
     * Blocks until the encoder listens on its input port, at most
     * readinessTimeoutMs. On any failure everything created so far is
     * released and the state is Stopped.
     */
    core::Result<void, RecorderError> start(const std::vector<session::ProducerRecord>& videoProducers);

    /**
     * @brief Stop the encoder and release tap consumer and tap transport.
     *        Repeated calls are no-ops.
     */
    void stop();

    void setFailureCallback(RecorderFailureCallback callback);

    [[nodiscard]] RecorderState state() const;

    /**
     * @brief Connected or Recording.
     */
    [[nodiscard]] bool isActive() const;

    [[nodiscard]] const core::StreamKey& streamKey() const { return streamKey_; }

    /**
     * @brief <pathPrefix>/<streamKey>/playlist.m3u8
     */
    [[nodiscard]] std::string playbackUrl() const;

    [[nodiscard]] std::string outputDirectory() const;

    /**
     * @brief Producer the tap reads, empty before start().
     */
    [[nodiscard]] core::ProducerId sourceProducerId() const;

    OutputFileStatus checkFiles() const;

private:
    RecordingBridge(core::StreamKey streamKey, RecordingEnvironment environment);

    core::Result<void, RecorderError> fail(RecorderError error);
    bool outputDirectoryContained() const;

    core::Result<void, RecorderError> awaitEncoderReady(uint16_t port);

    void onEncoderLine(const std::string& line);
    void onEncoderExit(const pal::ProcessExit& exit);

    /**
     * @brief Move every resource out under the lock, set Stopped, then
     *        release the resources outside the lock.
     */
    void teardown();

    void scheduleFileCheck();

    core::StreamKey streamKey_;
    RecordingEnvironment env_;
    std::string outputDirectory_;

    mutable std::mutex mutex_;
    RecorderState state_ = RecorderState::Idle;
    core::ProducerId sourceProducerId_;
    std::optional<engine::PassiveTap> tap_;
    std::optional<engine::ConsumerHandle> consumer_;
    pal::ProcessHandle process_{pal::INVALID_PROCESS_HANDLE};
    uint16_t encoderPort_ = 0;
    bool encoderExited_ = false;
    pal::ProcessExit exitInfo_;
    pal::TimerHandle fileCheckTimer_{pal::INVALID_TIMER_HANDLE};
    RecorderFailureCallback failureCallback_;
};

} // namespace streaming
} // namespace mediarelay

#endif // MEDIARELAY_STREAMING_RECORDING_BRIDGE_HPP
