// MediaRelay - WebRTC SFU Signaling Server
// Test Support - Configurable UDP listener table

#ifndef MEDIARELAY_TEST_SUPPORT_FAKE_PORT_WATCHER_HPP
#define MEDIARELAY_TEST_SUPPORT_FAKE_PORT_WATCHER_HPP

#include "mediarelay/streaming/port_watcher.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <set>

namespace mediarelay {
namespace test {

class FakePortWatcher : public streaming::IPortWatcher {
public:
    bool isListening(uint16_t port) const override {
        ++queries_;
        std::function<void(uint16_t)> onQuery;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            onQuery = onQuery_;
        }
        if (onQuery) {
            onQuery(port);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return listenAll_ || listening_.count(port) > 0;
    }

    /**
     * @brief Run before every answer, e.g. to change the world the caller
     *        is about to act on.
     */
    void setOnQuery(std::function<void(uint16_t)> onQuery) {
        std::lock_guard<std::mutex> lock(mutex_);
        onQuery_ = std::move(onQuery);
    }

    void setListening(uint16_t port) {
        std::lock_guard<std::mutex> lock(mutex_);
        listening_.insert(port);
    }

    /**
     * @brief Report every port as bound, as a started encoder would.
     */
    void setListenAll(bool listenAll) {
        std::lock_guard<std::mutex> lock(mutex_);
        listenAll_ = listenAll;
    }

    int queries() const { return queries_.load(); }

private:
    mutable std::mutex mutex_;
    std::set<uint16_t> listening_;
    bool listenAll_ = false;
    std::function<void(uint16_t)> onQuery_;
    mutable std::atomic<int> queries_{0};
};

} // namespace test
} // namespace mediarelay

#endif // MEDIARELAY_TEST_SUPPORT_FAKE_PORT_WATCHER_HPP
