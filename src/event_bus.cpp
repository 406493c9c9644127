#include "event_bus.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <iterator>

namespace callgate {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;

    auto& current = lists_[tag];
    auto next = current ? std::make_shared<HandlerList>(*current)
                        : std::make_shared<HandlerList>();
    next->push_back(Subscription{id, std::move(handler)});
    current = std::move(next);
    tag_of_.emplace(id, tag);
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto tag_it = tag_of_.find(id);
    if (tag_it == tag_of_.end()) return false;

    auto list_it = lists_.find(tag_it->second);
    tag_of_.erase(tag_it);
    if (list_it == lists_.end()) return false;

    auto next = std::make_shared<HandlerList>();
    next->reserve(list_it->second->size());
    std::copy_if(list_it->second->begin(), list_it->second->end(),
                 std::back_inserter(*next),
                 [id](const Subscription& s) { return s.id != id; });
    if (next->empty())
        lists_.erase(list_it);
    else
        list_it->second = std::move(next);
    return true;
}

void EventBus::publish(const Event& event) noexcept {
    std::shared_ptr<const HandlerList> list;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = lists_.find(event.type_tag);
        if (it == lists_.end()) return;
        list = it->second;
    }
    for (const auto& sub : *list) {
        try {
            sub.handler(event);
        } catch (const std::exception& e) {
            handler_failures_.fetch_add(1, std::memory_order_relaxed);
            std::cerr << "[event_bus] " << event.type_tag << " handler #" << sub.id
                      << " failed: " << e.what() << "\n";
        }
    }
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lists_.clear();
    tag_of_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lists_.find(tag);
    return it == lists_.end() ? 0 : it->second->size();
}

} // namespace callgate
