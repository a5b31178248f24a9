// MediaRelay - WebRTC SFU Signaling Server
// Stream Lifecycle Manager Implementation

#include "mediarelay/streaming/stream_lifecycle.hpp"

#include <algorithm>
#include <chrono>

namespace mediarelay {
namespace streaming {

namespace {

const char* LOG_CATEGORY = "Streams";

core::JsonValue membersToJson(const std::vector<core::ClientId>& members) {
    core::JsonValue list = core::JsonValue::array();
    for (const auto& member : members) {
        list.push(member);
    }
    return list;
}

} // namespace

const char* streamStateToString(StreamState state) {
    switch (state) {
        case StreamState::Absent: return "absent";
        case StreamState::Active: return "active";
        case StreamState::Recording: return "recording";
    }
    return "unknown";
}

// =============================================================================
// Construction
// =============================================================================

StreamLifecycleManager::StreamLifecycleManager(
    session::ISessionRegistry& sessions,
    session::IEventPublisher& events,
    RecorderFactory recorderFactory,
    std::shared_ptr<core::StructuredLogger> logger
)
    : sessions_(sessions)
    , events_(events)
    , recorderFactory_(std::move(recorderFactory))
    , logger_(std::move(logger))
{
}

StreamLifecycleManager::~StreamLifecycleManager() {
    stopAll();
}

// =============================================================================
// Broadcast Control
// =============================================================================

core::Result<BroadcastResult, core::Error> StreamLifecycleManager::startBroadcast(
    const core::StreamKey& streamKey,
    const core::ClientId& clientId
) {
    const core::StreamKey key = streamKey.empty() ? generateStreamKey() : streamKey;
    if (!core::isValidStreamKey(key)) {
        MEDIARELAY_LOG_WARNING(logger_, LOG_CATEGORY, "Rejected stream key from " + clientId);
        return core::Result<BroadcastResult, core::Error>::error(
            core::Error{core::ErrorCode::InvalidArgument,
                        "Stream key must be 1-64 characters of [A-Za-z0-9_-]"});
    }

    std::shared_ptr<StreamGroup> group;
    std::unique_lock<std::mutex> groupLock;
    while (true) {
        group = acquireGroup(key);
        groupLock = std::unique_lock<std::mutex>(group->mutex);
        if (!group->removed) {
            break;
        }
        // Deleted by its last member between lookup and lock
        groupLock.unlock();
    }

    if (std::find(group->members.begin(), group->members.end(), clientId) == group->members.end()) {
        group->members.push_back(clientId);
        refreshView(*group);
    }

    BroadcastResult result;
    result.streamKey = key;

    if (group->recorder) {
        result.playbackUrl = group->recorder->playbackUrl();
        result.state = StreamState::Recording;
        return core::Result<BroadcastResult, core::Error>::success(std::move(result));
    }

    std::vector<session::ProducerRecord> videoProducers = sessions_.videoProducers();
    MEDIARELAY_LOG_INFO(logger_, LOG_CATEGORY,
        "Starting broadcast " + key + " for " + clientId + " (" +
        std::to_string(videoProducers.size()) + " video producers)");

    if (videoProducers.empty()) {
        result.state = StreamState::Active;
        return core::Result<BroadcastResult, core::Error>::success(std::move(result));
    }

    std::shared_ptr<RecordingBridge> recorder = recorderFactory_(key);
    if (!recorder) {
        return core::Result<BroadcastResult, core::Error>::error(
            core::Error{core::ErrorCode::RecorderStartFailed, "No recorder available"});
    }

    const RecordingBridge* recorderId = recorder.get();
    recorder->setFailureCallback(
        [this, recorderId](const core::StreamKey& failedKey, const std::string& reason) {
            onRecorderFailed(failedKey, recorderId, reason);
        });

    auto started = recorder->start(videoProducers);
    if (started.isError()) {
        MEDIARELAY_LOG_WARNING(logger_, LOG_CATEGORY,
            "Broadcast " + key + " stays active without recording: " + started.error().message);
        return core::Result<BroadcastResult, core::Error>::error(
            core::Error{core::ErrorCode::RecorderStartFailed,
                        "Failed to start HLS recording: " + started.error().message});
    }

    group->recorder = recorder;
    refreshView(*group);
    result.playbackUrl = recorder->playbackUrl();
    result.state = StreamState::Recording;
    std::vector<core::ClientId> members = group->members;
    groupLock.unlock();

    core::JsonValue live = core::JsonValue::object();
    live.set("streamId", key);
    live.set("playlistUrl", result.playbackUrl);
    live.set("streamers", membersToJson(members));
    events_.publishAll("streamLive", live);

    MEDIARELAY_LOG_INFO(logger_, LOG_CATEGORY, "Broadcast " + key + " is live at " + result.playbackUrl);
    return core::Result<BroadcastResult, core::Error>::success(std::move(result));
}

core::Result<void, core::Error> StreamLifecycleManager::stopBroadcast(
    const core::StreamKey& streamKey,
    const core::ClientId& clientId
) {
    std::shared_ptr<StreamGroup> group = findGroup(streamKey);
    if (group) {
        leaveGroup(group, clientId);
    }
    return core::Result<void, core::Error>::success();
}

void StreamLifecycleManager::removeClient(const core::ClientId& clientId) {
    std::vector<std::shared_ptr<StreamGroup>> snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(groupsMutex_);
        snapshot.reserve(groups_.size());
        for (const auto& entry : groups_) {
            snapshot.push_back(entry.second);
        }
    }

    for (const auto& group : snapshot) {
        leaveGroup(group, clientId);
    }
}

void StreamLifecycleManager::leaveGroup(
    const std::shared_ptr<StreamGroup>& group,
    const core::ClientId& clientId
) {
    std::shared_ptr<RecordingBridge> recorder;
    {
        std::lock_guard<std::mutex> lock(group->mutex);
        if (group->removed) {
            return;
        }

        auto it = std::find(group->members.begin(), group->members.end(), clientId);
        if (it == group->members.end()) {
            return;
        }
        group->members.erase(it);

        if (!group->members.empty()) {
            refreshView(*group);
            return;
        }

        group->removed = true;
        recorder = std::move(group->recorder);
        refreshView(*group);
        eraseGroup(group);
    }

    if (!recorder) {
        MEDIARELAY_LOG_DEBUG(logger_, LOG_CATEGORY, "Broadcast " + group->key + " closed without recording");
        return;
    }

    recorder->stop();
    MEDIARELAY_LOG_INFO(logger_, LOG_CATEGORY, "Broadcast " + group->key + " ended");
    publishStreamEnded(group->key);
}

void StreamLifecycleManager::onRecorderFailed(
    const core::StreamKey& streamKey,
    const RecordingBridge* recorder,
    const std::string& reason
) {
    std::shared_ptr<StreamGroup> group = findGroup(streamKey);
    if (!group) {
        return;
    }

    std::shared_ptr<RecordingBridge> detached;
    {
        std::lock_guard<std::mutex> lock(group->mutex);
        if (group->removed || group->recorder.get() != recorder) {
            return;
        }
        detached = std::move(group->recorder);
        refreshView(*group);
    }

    MEDIARELAY_LOG_WARNING(logger_, LOG_CATEGORY,
        "Recorder of " + streamKey + " failed (" + reason + "), broadcast back to active");
    publishStreamEnded(streamKey);
}

void StreamLifecycleManager::publishStreamEnded(const core::StreamKey& streamKey) {
    core::JsonValue ended = core::JsonValue::object();
    ended.set("streamId", streamKey);
    events_.publishAll("streamEnded", ended);
}

void StreamLifecycleManager::stopAll() {
    std::map<core::StreamKey, std::shared_ptr<StreamGroup>> groups;
    {
        std::unique_lock<std::shared_mutex> lock(groupsMutex_);
        groups.swap(groups_);
    }

    for (auto& entry : groups) {
        std::shared_ptr<RecordingBridge> recorder;
        {
            std::lock_guard<std::mutex> lock(entry.second->mutex);
            entry.second->removed = true;
            recorder = std::move(entry.second->recorder);
            refreshView(*entry.second);
        }
        if (recorder) {
            recorder->stop();
        }
    }
}

// =============================================================================
// Queries
// =============================================================================

std::vector<StreamInfo> StreamLifecycleManager::activeStreams() const {
    std::vector<std::shared_ptr<StreamGroup>> snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(groupsMutex_);
        for (const auto& entry : groups_) {
            snapshot.push_back(entry.second);
        }
    }

    std::vector<StreamInfo> streams;
    streams.reserve(snapshot.size());
    for (const auto& group : snapshot) {
        StreamInfo info;
        info.streamKey = group->key;
        std::shared_ptr<RecordingBridge> recorder;
        {
            std::lock_guard<std::mutex> lock(group->viewMutex);
            if (group->viewRemoved) {
                continue;
            }
            info.members = group->viewMembers;
            recorder = group->viewRecorder;
        }
        if (recorder) {
            info.playbackUrl = recorder->playbackUrl();
            info.isLive = recorder->isActive();
        }
        streams.push_back(std::move(info));
    }
    return streams;
}

StreamState StreamLifecycleManager::streamState(const core::StreamKey& streamKey) const {
    std::shared_ptr<StreamGroup> group = findGroup(streamKey);
    if (!group) {
        return StreamState::Absent;
    }

    std::lock_guard<std::mutex> lock(group->viewMutex);
    if (group->viewRemoved) {
        return StreamState::Absent;
    }
    return group->viewRecorder ? StreamState::Recording : StreamState::Active;
}

size_t StreamLifecycleManager::streamCount() const {
    std::shared_lock<std::shared_mutex> lock(groupsMutex_);
    return groups_.size();
}

// =============================================================================
// Group Table
// =============================================================================

std::shared_ptr<StreamLifecycleManager::StreamGroup> StreamLifecycleManager::acquireGroup(
    const core::StreamKey& streamKey
) {
    std::unique_lock<std::shared_mutex> lock(groupsMutex_);
    auto it = groups_.find(streamKey);
    if (it != groups_.end()) {
        return it->second;
    }

    auto group = std::make_shared<StreamGroup>(streamKey);
    groups_.emplace(streamKey, group);
    return group;
}

std::shared_ptr<StreamLifecycleManager::StreamGroup> StreamLifecycleManager::findGroup(
    const core::StreamKey& streamKey
) const {
    std::shared_lock<std::shared_mutex> lock(groupsMutex_);
    auto it = groups_.find(streamKey);
    return it == groups_.end() ? nullptr : it->second;
}

void StreamLifecycleManager::refreshView(StreamGroup& group) {
    std::lock_guard<std::mutex> lock(group.viewMutex);
    group.viewMembers = group.members;
    group.viewRecorder = group.recorder;
    group.viewRemoved = group.removed;
}

void StreamLifecycleManager::eraseGroup(const std::shared_ptr<StreamGroup>& group) {
    std::unique_lock<std::shared_mutex> lock(groupsMutex_);
    auto it = groups_.find(group->key);
    if (it != groups_.end() && it->second == group) {
        groups_.erase(it);
    }
}

core::StreamKey StreamLifecycleManager::generateStreamKey() {
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        core::SystemClock::now().time_since_epoch());
    return "stream_" + std::to_string(now.count());
}

} // namespace streaming
} // namespace mediarelay
