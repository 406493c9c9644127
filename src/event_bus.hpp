#pragma once
#include "event.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace callgate {

using EventHandler = std::function<void(const Event&)>;

// Synchronous observability channel. The gateway publishes from whichever
// thread runs the query, so handlers must be thread-safe and quick.
//
// Each tag keeps an immutable handler list that is replaced on every
// subscribe/unsubscribe; publish() only takes the lock long enough to grab
// the current list.
class EventBus {
public:
    // Returns an id for unsubscribe(). Ids are never reused.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    bool unsubscribe(uint64_t id);

    // Handlers for event.type_tag run in registration order. One that throws
    // is logged and counted, and the rest still run.
    void publish(const Event& event) noexcept;

    void clear();

    size_t subscriber_count(const std::string& tag) const;

    uint64_t handler_failures() const noexcept {
        return handler_failures_.load(std::memory_order_relaxed);
    }

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };
    using HandlerList = std::vector<Subscription>;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const HandlerList>> lists_;
    std::unordered_map<uint64_t, std::string> tag_of_;
    uint64_t next_id_ = 1;
    std::atomic<uint64_t> handler_failures_{0};
};

// Subscribes a handler for one concrete event type, keyed by E::TAG.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

} // namespace callgate
