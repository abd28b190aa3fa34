#pragma once
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Ordered subscription channel. Subscribers are called synchronously on the
// publishing thread, in the order they subscribed.
template <typename Event>
class EventChannel {
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = int;

    SubscriptionId subscribe(Handler handler) {
        std::lock_guard lock(mtx_);
        int id = nextId_++;
        subscribers_.push_back({id, std::move(handler)});
        return id;
    }

    bool unsubscribe(SubscriptionId id) {
        std::lock_guard lock(mtx_);
        for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
            if (it->id == id) {
                subscribers_.erase(it);
                return true;
            }
        }
        return false;
    }

    // Handlers run outside the lock so one may unsubscribe itself
    void publish(const Event& event) const {
        std::vector<Subscriber> snapshot;
        {
            std::lock_guard lock(mtx_);
            snapshot = subscribers_;
        }
        for (auto& s : snapshot)
            s.handler(event);
    }

    size_t subscriberCount() const {
        std::lock_guard lock(mtx_);
        return subscribers_.size();
    }

private:
    struct Subscriber {
        SubscriptionId id;
        Handler        handler;
    };

    std::vector<Subscriber> subscribers_;
    int nextId_ = 1;
    mutable std::mutex mtx_;
};

// Status changes published by the persistence orchestrator
struct PersistenceEvent {
    enum class Type {
        SessionSaved,
        SessionRestored,
        SessionCleared,
        SessionExpired,
        OperationFailed
    } type;

    int         terminalCount = 0;
    std::string detail;
};
