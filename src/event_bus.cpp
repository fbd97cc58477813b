#include "event_bus.hpp"

#include <algorithm>
#include <cstring>

namespace cmdgate {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    subs_.push_back(Subscription{id, tag, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(subs_.begin(), subs_.end(),
                           [id](const Subscription& s) { return s.id == id; });
    if (it == subs_.end()) return false;
    subs_.erase(it);
    return true;
}

void EventBus::publish(const Event& event) const {
    std::vector<EventHandler> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& sub : subs_) {
            if (std::strcmp(sub.tag.c_str(), event.type_tag) == 0) {
                to_call.push_back(sub.handler);
            }
        }
    }
    for (const auto& handler : to_call) {
        handler(event);
    }
}

bool EventBus::has_subscribers(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(subs_.begin(), subs_.end(),
                       [&tag](const Subscription& s) { return s.tag == tag; });
}

} // namespace cmdgate
