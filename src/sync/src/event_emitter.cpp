#include "rfsync/sync/event_emitter.h"
#include "rfsync/core/logging.h"

namespace rfsync {
namespace sync {

thread_local EventEmitter::DeferredDispatch* EventEmitter::activeScope_ = nullptr;

EventEmitter::DeferredDispatch::DeferredDispatch(EventEmitter& emitter)
    : emitter_(emitter), previous_(EventEmitter::activeScope_) {
    EventEmitter::activeScope_ = this;
}

EventEmitter::DeferredDispatch::~DeferredDispatch() {
    EventEmitter::activeScope_ = previous_;

    // An enclosing scope on the same emitter may still be under a lock
    if (DeferredDispatch* outer = emitter_.openScopeFor(previous_)) {
        outer->pending_.insert(outer->pending_.end(), pending_.begin(), pending_.end());
        return;
    }
    for (const auto& event : pending_) {
        emitter_.notify(event);
    }
}

EventEmitter::EventEmitter(std::shared_ptr<store::ISyncEventLog> eventLog)
    : eventLog_(std::move(eventLog)) {}

ListenerId EventEmitter::subscribe(SyncEventListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    ListenerId id = nextId_++;
    listeners_[id] = std::move(listener);
    return id;
}

bool EventEmitter::unsubscribe(ListenerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.erase(id) > 0;
}

size_t EventEmitter::listenerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

core::SyncEvent EventEmitter::emit(core::SyncEvent event) {
    core::SyncEvent stored = eventLog_->append(std::move(event));

    if (DeferredDispatch* scope = openScopeFor(activeScope_)) {
        scope->pending_.push_back(stored);
    } else {
        notify(stored);
    }
    return stored;
}

EventEmitter::DeferredDispatch* EventEmitter::openScopeFor(DeferredDispatch* from) const {
    for (DeferredDispatch* scope = from; scope != nullptr; scope = scope->previous_) {
        if (&scope->emitter_ == this) {
            return scope;
        }
    }
    return nullptr;
}

void EventEmitter::notify(const core::SyncEvent& event) {
    std::vector<SyncEventListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners.reserve(listeners_.size());
        for (const auto& pair : listeners_) {
            listeners.push_back(pair.second);
        }
    }

    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            core::getLogger(core::loggers::SYNC)
                ->error("SyncEvent listener failed on event {}: {}", event.sequence, e.what());
        }
    }
}

} // namespace sync
} // namespace rfsync
