/*
 * Listener registry with copy-on-write delivery - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <toolbridge/util/log.hpp>
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace toolbridge {

using SubscriptionId = std::uint64_t;

namespace detail {
// Listener calls in progress on this thread, across every bus.
inline int& delivery_depth() {
    static thread_local int depth = 0;
    return depth;
}
} // namespace detail

// publish() iterates a snapshot of the listeners, so subscribe/unsubscribe
// may run concurrently with delivery (also from inside a listener).
// Listeners added during a publish do not see that event; once unsubscribe()
// returns the listener is not invoked again. Called from outside any listener,
// unsubscribe() also waits for a delivery already running on another thread.
// Called from inside a listener it does not wait, so listeners removing each
// other from two publishing threads cannot deadlock.
template <typename Event>
class EventBus {
public:
    using Listener = std::function<void(const Event&)>;

    SubscriptionId subscribe(Listener fn) {
        auto entry = std::make_shared<Entry>();
        entry->fn = std::move(fn);
        std::lock_guard<std::mutex> lk(m_mutex);
        entry->id = m_next_id++;
        auto next = std::make_shared<List>(*m_entries);
        next->push_back(entry);
        m_entries = std::move(next);
        return entry->id;
    }

    bool unsubscribe(SubscriptionId id) {
        std::shared_ptr<Entry> removed;
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            auto next = std::make_shared<List>(*m_entries);
            auto it = std::find_if(next->begin(), next->end(), [&](const std::shared_ptr<Entry>& e){ return e->id == id; });
            if (it == next->end()) return false;
            removed = *it;
            next->erase(it);
            m_entries = std::move(next);
        }
        removed->active = false;
        if (detail::delivery_depth() == 0) {
            // Waits for a delivery already running on another thread.
            std::lock_guard<std::recursive_mutex> g(removed->guard);
        }
        return true;
    }

    void publish(const Event& ev) const {
        std::shared_ptr<const List> snapshot;
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            snapshot = m_entries;
        }
        for (auto &e : *snapshot) {
            std::lock_guard<std::recursive_mutex> g(e->guard);
            if (!e->active) continue;
            Delivering in_listener;
            try {
                e->fn(ev);
            } catch (const std::exception& ex) {
                log::warn("events", std::string("listener threw: ") + ex.what());
            }
        }
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_entries->size();
    }
private:
    struct Entry {
        SubscriptionId id = 0;
        Listener fn;
        std::recursive_mutex guard; // held while fn runs; a listener may publish again
        std::atomic<bool> active{true};
    };
    using List = std::vector<std::shared_ptr<Entry>>;
    struct Delivering {
        Delivering() { ++detail::delivery_depth(); }
        ~Delivering() { --detail::delivery_depth(); }
    };

    mutable std::mutex m_mutex;
    std::shared_ptr<const List> m_entries = std::make_shared<const List>();
    SubscriptionId m_next_id = 1;
};

} // namespace toolbridge
