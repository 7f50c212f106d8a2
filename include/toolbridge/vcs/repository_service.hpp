/*
 * Per-project git repository service - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <toolbridge/task/model_refresher.hpp>
#include <toolbridge/vcs/git_client.hpp>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace toolbridge {

// Owns the detected repository of one project directory, its cached status
// and an optional periodic refresh. Constructed explicitly by the application.
class GitRepositoryService {
public:
    using StatusPtr = std::shared_ptr<const RepositoryStatus>;

    GitRepositoryService(const GitClient& client, std::filesystem::path project_dir);
    ~GitRepositoryService();
    GitRepositoryService(const GitRepositoryService&) = delete;
    GitRepositoryService& operator=(const GitRepositoryService&) = delete;

    // Looks up the repository containing the project directory; stops the
    // auto refresh when there is none. Returns whether one was found.
    bool detect();
    bool is_active() const;
    std::optional<GitRepository> repository() const;

    // Single-flight status load. The future throws GitError when git fails
    // or no repository was detected.
    std::shared_future<StatusPtr> refresh_status(bool force = false);
    StatusPtr cached_status() const { return m_status.cached(); }
    ModelRefresher<RepositoryStatus>& status_model() { return m_status; }

    // Refreshes now and then every interval on a background thread.
    // Throws std::invalid_argument for a non-positive interval.
    void start_auto_refresh(std::chrono::milliseconds interval);
    void stop_auto_refresh();
    bool is_auto_refreshing() const;

    // fetch --prune, then a forced status refresh.
    void fetch(const GitProgressCallback& progress = {}, const CancellationToken* token = nullptr);
    std::optional<std::chrono::system_clock::time_point> last_fetch() const;

    GitIdentity identity() const { return m_client.identity(); }
private:
    RepositoryStatus load_status() const;
    GitRepository require_repository() const;
    void auto_refresh_loop(std::chrono::milliseconds interval);

    const GitClient& m_client;
    std::filesystem::path m_project_dir;
    mutable std::mutex m_mutex;
    std::optional<GitRepository> m_repo;
    std::optional<std::chrono::system_clock::time_point> m_last_fetch;
    ModelRefresher<RepositoryStatus> m_status;

    mutable std::mutex m_timer_mutex;
    std::condition_variable m_timer_cv;
    bool m_timer_stop = false;
    std::thread m_timer;
};

} // namespace toolbridge
