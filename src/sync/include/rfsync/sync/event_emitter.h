#pragma once

#include "rfsync/core/types.h"
#include "rfsync/store/sync_event_log.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace rfsync {
namespace sync {

using SyncEventListener = std::function<void(const core::SyncEvent&)>;
using ListenerId = uint64_t;

/**
 * @brief Single outbound SyncEvent stream
 *
 * Every event is appended to the event log, then handed to the listeners
 * on the emitting thread. While a DeferredDispatch is open on that thread
 * the listeners run when the outermost scope closes instead, so code that
 * holds a device row lock never calls out to listeners.
 */
class EventEmitter {
public:
    /**
     * @brief Holds back listener notification until the scope ends
     *
     * Open it before taking a device lock; it is destroyed after the lock
     * is released. Events are still appended to the log immediately.
     */
    class DeferredDispatch {
    public:
        explicit DeferredDispatch(EventEmitter& emitter);
        ~DeferredDispatch();

        DeferredDispatch(const DeferredDispatch&) = delete;
        DeferredDispatch& operator=(const DeferredDispatch&) = delete;

        size_t pendingCount() const { return pending_.size(); }

    private:
        friend class EventEmitter;

        EventEmitter& emitter_;
        DeferredDispatch* previous_;
        std::vector<core::SyncEvent> pending_;
    };

    explicit EventEmitter(std::shared_ptr<store::ISyncEventLog> eventLog);

    ListenerId subscribe(SyncEventListener listener);
    bool unsubscribe(ListenerId id);
    size_t listenerCount() const;

    /**
     * @brief Append an event to the log and notify listeners
     * @return The stored event with its sequence number
     */
    core::SyncEvent emit(core::SyncEvent event);

    std::shared_ptr<store::ISyncEventLog> eventLog() const { return eventLog_; }

private:
    void notify(const core::SyncEvent& event);
    DeferredDispatch* openScopeFor(DeferredDispatch* from) const;

    static thread_local DeferredDispatch* activeScope_;

    std::shared_ptr<store::ISyncEventLog> eventLog_;
    mutable std::mutex mutex_;
    std::map<ListenerId, SyncEventListener> listeners_;
    ListenerId nextId_ = 1;
};

} // namespace sync
} // namespace rfsync
