#pragma once

#include <functional>
#include <vector>
#include <algorithm>
#include <cstdint>

using SubscriptionId = uint64_t;

template <typename... Args>
class Emitter {
public:
    using Listener = std::function<void(Args...)>;

    SubscriptionId subscribe(Listener listener) {
        SubscriptionId id = next_id_++;
        listeners_.push_back({id, std::move(listener)});
        return id;
    }

    void unsubscribe(SubscriptionId id) {
        listeners_.erase(
            std::remove_if(listeners_.begin(), listeners_.end(),
                [id](const Entry& e) { return e.id == id; }),
            listeners_.end()
        );
    }

    // Listeners may unsubscribe themselves or others while firing.
    void fire(Args... args) {
        std::vector<SubscriptionId> ids;
        ids.reserve(listeners_.size());
        for (const auto& e : listeners_) ids.push_back(e.id);

        for (SubscriptionId id : ids) {
            auto it = std::find_if(listeners_.begin(), listeners_.end(),
                [id](const Entry& e) { return e.id == id; });
            if (it == listeners_.end()) continue;
            Listener listener = it->listener;
            listener(args...);
        }
    }

    void clear() { listeners_.clear(); }
    size_t listener_count() const { return listeners_.size(); }

private:
    struct Entry {
        SubscriptionId id;
        Listener listener;
    };

    std::vector<Entry> listeners_;
    SubscriptionId next_id_ = 1;
};
