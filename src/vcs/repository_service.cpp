/*
 * Per-project git repository service - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/vcs/repository_service.hpp>
#include <toolbridge/util/log.hpp>
#include <stdexcept>

namespace toolbridge {

GitRepositoryService::GitRepositoryService(const GitClient& client, std::filesystem::path project_dir)
    : m_client(client),
      m_project_dir(std::move(project_dir)),
      m_status([this] { return load_status(); }) {}

GitRepositoryService::~GitRepositoryService() {
    stop_auto_refresh();
    m_status.wait_idle();
}

bool GitRepositoryService::detect() {
    auto repo = m_client.detect_repository(m_project_dir);
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_repo = repo;
    }
    if (!repo) {
        log::info("git", "no repository at " + m_project_dir.string());
        stop_auto_refresh();
        return false;
    }
    log::debug("git", "repository root " + repo->root.string());
    return true;
}

bool GitRepositoryService::is_active() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_repo.has_value();
}

std::optional<GitRepository> GitRepositoryService::repository() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_repo;
}

GitRepository GitRepositoryService::require_repository() const {
    auto repo = repository();
    if (!repo) throw GitError("no git repository detected for " + m_project_dir.string());
    return *repo;
}

RepositoryStatus GitRepositoryService::load_status() const {
    return m_client.status(require_repository());
}

std::shared_future<GitRepositoryService::StatusPtr> GitRepositoryService::refresh_status(bool force) {
    return m_status.refresh(force);
}

void GitRepositoryService::start_auto_refresh(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) throw std::invalid_argument("auto refresh interval must be positive");
    std::lock_guard<std::mutex> lk(m_timer_mutex);
    if (m_timer.joinable()) return;
    m_timer_stop = false;
    m_timer = std::thread([this, interval] { auto_refresh_loop(interval); });
}

void GitRepositoryService::stop_auto_refresh() {
    std::thread t;
    {
        std::lock_guard<std::mutex> lk(m_timer_mutex);
        if (!m_timer.joinable()) return;
        m_timer_stop = true;
        t = std::move(m_timer);
    }
    m_timer_cv.notify_all();
    if (t.get_id() == std::this_thread::get_id()) t.detach();
    else t.join();
}

bool GitRepositoryService::is_auto_refreshing() const {
    std::lock_guard<std::mutex> lk(m_timer_mutex);
    return m_timer.joinable();
}

void GitRepositoryService::auto_refresh_loop(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lk(m_timer_mutex);
    while (!m_timer_stop) {
        lk.unlock();
        try {
            refresh_status(true).get();
        } catch (const std::exception& e) {
            log::warn("git", std::string("status refresh failed: ") + e.what());
        }
        lk.lock();
        m_timer_cv.wait_for(lk, interval, [this] { return m_timer_stop; });
    }
}

void GitRepositoryService::fetch(const GitProgressCallback& progress, const CancellationToken* token) {
    auto repo = require_repository();
    m_client.fetch(repo, progress, token);
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_last_fetch = std::chrono::system_clock::now();
    }
    refresh_status(true).get();
}

std::optional<std::chrono::system_clock::time_point> GitRepositoryService::last_fetch() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_last_fetch;
}

} // namespace toolbridge
