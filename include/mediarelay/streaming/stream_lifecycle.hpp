// MediaRelay - WebRTC SFU Signaling Server
// Stream Lifecycle Manager - Broadcast groups and their recorders
//
// Responsibilities:
// - Maintain named broadcast groups and their ordered member sets
// - Attach at most one recorder per group (check-then-attach under a per-key lock)
// - Stop the recorder and delete the group when the last member leaves
// - Publish streamLive / streamEnded on transitions into and out of Recording
//
// State machine per stream key:
//   Absent -> Active -> Recording -> Absent
//   Recording -> Active when the recorder dies

#ifndef MEDIARELAY_STREAMING_STREAM_LIFECYCLE_HPP
#define MEDIARELAY_STREAMING_STREAM_LIFECYCLE_HPP

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "mediarelay/core/error_codes.hpp"
#include "mediarelay/core/result.hpp"
#include "mediarelay/core/structured_logger.hpp"
#include "mediarelay/core/types.hpp"
#include "mediarelay/session/client_registry.hpp"
#include "mediarelay/session/session_registry.hpp"
#include "mediarelay/streaming/recording_bridge.hpp"

namespace mediarelay {
namespace streaming {

// =============================================================================
// Types
// =============================================================================

enum class StreamState {
    Absent,
    Active,      ///< Group exists, no recorder attached
    Recording    ///< Recorder attached
};

const char* streamStateToString(StreamState state);

/**
 * @brief Snapshot of one group for discovery queries.
 */
struct StreamInfo {
    core::StreamKey streamKey;
    std::string playbackUrl;                ///< Empty without a recorder
    std::vector<core::ClientId> members;    ///< Join order
    bool isLive = false;                    ///< Recorder is Connected or Recording
};

/**
 * @brief Outcome of a successful startBroadcast().
 */
struct BroadcastResult {
    core::StreamKey streamKey;
    std::string playbackUrl;
    StreamState state = StreamState::Active;
};

/**
 * @brief Creates an Idle recorder for a stream key.
 */
using RecorderFactory = std::function<std::shared_ptr<RecordingBridge>(const core::StreamKey& streamKey)>;

// =============================================================================
// Stream Lifecycle Interface
// =============================================================================

class IStreamLifecycleManager {
public:
    virtual ~IStreamLifecycleManager() = default;

    /**
     * @brief Join a broadcast group, creating it when absent.
     *
     * An empty key is replaced by stream_<epoch ms>. When a video producer
     * exists and no recorder is attached a recorder is started; if it fails
     * the group stays Active and RecorderStartFailed is returned.
     */
    virtual core::Result<BroadcastResult, core::Error> startBroadcast(
        const core::StreamKey& streamKey,
        const core::ClientId& clientId
    ) = 0;

    /**
     * @brief Leave a broadcast group. Unknown keys and non-members succeed.
     */
    virtual core::Result<void, core::Error> stopBroadcast(
        const core::StreamKey& streamKey,
        const core::ClientId& clientId
    ) = 0;

    /**
     * @brief Implicit stopBroadcast for every group containing the client.
     */
    virtual void removeClient(const core::ClientId& clientId) = 0;

    virtual std::vector<StreamInfo> activeStreams() const = 0;

    virtual StreamState streamState(const core::StreamKey& streamKey) const = 0;

    virtual size_t streamCount() const = 0;

    /**
     * @brief Stop every recorder and drop every group without events.
     */
    virtual void stopAll() = 0;
};

// =============================================================================
// Stream Lifecycle Manager Implementation
// =============================================================================

/**
 * @brief Thread-safe stream lifecycle manager.
 *
 * @code
 * StreamLifecycleManager streams(sessions, clients,
 *     [&](const core::StreamKey& key) { return RecordingBridge::create(key, environment); },
 *     logger);
 *
 * auto started = streams.startBroadcast("", "c1");
 * if (started.isSuccess() && started.value().state == StreamState::Recording) {
 *     // streamLive was published to every client
 * }
 * @endcode
 *
 * Thread Safety:
 * - The group table is guarded by a std::shared_mutex
 * - Membership changes and recorder attachment of one key run under that
 *   group's mutex; recorder startup blocks other operations on the same key
 *   only
 * - Queries read a per-group snapshot and never wait for a recorder start
 * - Events are published with no lock held
 */
class StreamLifecycleManager : public IStreamLifecycleManager {
public:
    StreamLifecycleManager(
        session::ISessionRegistry& sessions,
        session::IEventPublisher& events,
        RecorderFactory recorderFactory,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );
    ~StreamLifecycleManager() override;

    StreamLifecycleManager(const StreamLifecycleManager&) = delete;
    StreamLifecycleManager& operator=(const StreamLifecycleManager&) = delete;

    core::Result<BroadcastResult, core::Error> startBroadcast(
        const core::StreamKey& streamKey,
        const core::ClientId& clientId
    ) override;

    core::Result<void, core::Error> stopBroadcast(
        const core::StreamKey& streamKey,
        const core::ClientId& clientId
    ) override;

    void removeClient(const core::ClientId& clientId) override;

    std::vector<StreamInfo> activeStreams() const override;

    StreamState streamState(const core::StreamKey& streamKey) const override;

    size_t streamCount() const override;

    void stopAll() override;

private:
    struct StreamGroup {
        explicit StreamGroup(core::StreamKey k) : key(std::move(k)) {}

        std::mutex mutex;
        core::StreamKey key;
        std::vector<core::ClientId> members;
        std::shared_ptr<RecordingBridge> recorder;
        bool removed = false;    ///< Erased from the table; callers retry

        // Copy of the fields above for queries, which must not wait out a
        // recorder start holding `mutex`. Written with `mutex` held.
        mutable std::mutex viewMutex;
        std::vector<core::ClientId> viewMembers;
        std::shared_ptr<RecordingBridge> viewRecorder;
        bool viewRemoved = false;
    };

    static void refreshView(StreamGroup& group);

    std::shared_ptr<StreamGroup> acquireGroup(const core::StreamKey& streamKey);
    std::shared_ptr<StreamGroup> findGroup(const core::StreamKey& streamKey) const;
    void eraseGroup(const std::shared_ptr<StreamGroup>& group);

    void leaveGroup(const std::shared_ptr<StreamGroup>& group, const core::ClientId& clientId);

    void onRecorderFailed(
        const core::StreamKey& streamKey,
        const RecordingBridge* recorder,
        const std::string& reason
    );

    void publishStreamEnded(const core::StreamKey& streamKey);

    static core::StreamKey generateStreamKey();

    session::ISessionRegistry& sessions_;
    session::IEventPublisher& events_;
    RecorderFactory recorderFactory_;
    std::shared_ptr<core::StructuredLogger> logger_;

    mutable std::shared_mutex groupsMutex_;
    std::map<core::StreamKey, std::shared_ptr<StreamGroup>> groups_;
};

} // namespace streaming
} // namespace mediarelay

#endif // MEDIARELAY_STREAMING_STREAM_LIFECYCLE_HPP
