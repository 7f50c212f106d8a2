/*
 * Single-flight model refresh with cache - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <toolbridge/task/event_bus.hpp>
#include <toolbridge/util/log.hpp>
#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

enum class ReloadPhase { Started, Succeeded, Failed };

template <typename Model>
struct ReloadEvent {
    ReloadPhase phase;
    std::shared_ptr<const Model> model; // Succeeded only
    std::string error;                  // Failed only
};

// Loads a model on a background thread.
// refresh(false): joins the in-flight load if any, else returns the cached
// model as a ready future, else starts a load.
// refresh(true): always starts a new load; loads never overlap.
// The cache is replaced only by a successful load.
template <typename Model>
class ModelRefresher {
public:
    using ModelPtr = std::shared_ptr<const Model>;
    using Loader = std::function<Model()>;
    using Listener = std::function<void(const ReloadEvent<Model>&)>;

    explicit ModelRefresher(Loader loader) : m_loader(std::move(loader)) {}
    ~ModelRefresher() { wait_idle(); }
    ModelRefresher(const ModelRefresher&) = delete;
    ModelRefresher& operator=(const ModelRefresher&) = delete;

    std::shared_future<ModelPtr> refresh(bool force = false) {
        std::lock_guard<std::mutex> lk(m_mutex);
        prune_locked();
        if (!force) {
            if (m_inflight && !is_ready(*m_inflight)) return *m_inflight;
            if (auto c = cached()) {
                std::promise<ModelPtr> p;
                p.set_value(std::move(c));
                return p.get_future().share();
            }
        }
        auto fut = std::async(std::launch::async, [this] { return load(); }).share();
        m_inflight = fut;
        m_pending.push_back(fut);
        return fut;
    }

    // nullptr until the first successful load.
    ModelPtr cached() const { return std::atomic_load(&m_cache); }

    bool is_refreshing() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_inflight && !is_ready(*m_inflight);
    }

    // Blocks until no load is running.
    void wait_idle() {
        std::vector<std::shared_future<ModelPtr>> pending;
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            pending = m_pending;
        }
        for (auto &f : pending) f.wait();
    }

    SubscriptionId subscribe(Listener fn) { return m_bus.subscribe(std::move(fn)); }
    bool unsubscribe(SubscriptionId id) { return m_bus.unsubscribe(id); }
private:
    static bool is_ready(const std::shared_future<ModelPtr>& f) {
        return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void prune_locked() {
        m_pending.erase(std::remove_if(m_pending.begin(), m_pending.end(), is_ready), m_pending.end());
    }

    ModelPtr load() {
        std::lock_guard<std::mutex> run(m_run_mutex);
        m_bus.publish(ReloadEvent<Model>{ReloadPhase::Started, nullptr, {}});
        try {
            ModelPtr model = std::make_shared<const Model>(m_loader());
            std::atomic_store(&m_cache, model);
            m_bus.publish(ReloadEvent<Model>{ReloadPhase::Succeeded, model, {}});
            return model;
        } catch (const std::exception& e) {
            log::warn("refresh", std::string("model reload failed: ") + e.what());
            m_bus.publish(ReloadEvent<Model>{ReloadPhase::Failed, nullptr, e.what()});
            throw;
        }
    }

    Loader m_loader;
    EventBus<ReloadEvent<Model>> m_bus;
    mutable std::mutex m_mutex;
    std::mutex m_run_mutex;
    std::optional<std::shared_future<ModelPtr>> m_inflight;
    std::vector<std::shared_future<ModelPtr>> m_pending;
    ModelPtr m_cache;
};

} // namespace toolbridge
