#pragma once
#include "event.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace cmdgate {

using EventHandler = std::function<void(const Event&)>;

// Synchronous publish/subscribe channel for the structured events the
// command engine emits. Safe to publish from concurrent HTTP workers.
class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Handlers run on the publishing thread, in subscription order,
    // without the bus lock held.
    void publish(const Event& event) const;

    // True when at least one handler listens for tag. Publishers use this
    // to skip building event payloads nobody reads.
    bool has_subscribers(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        std::string tag;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Subscription> subs_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Publish through an optional bus.
inline void emit(const EventBus* bus, const Event& event) {
    if (bus) bus->publish(event);
}

} // namespace cmdgate
