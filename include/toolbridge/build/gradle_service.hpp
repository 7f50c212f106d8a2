/*
 * Gradle task execution service - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <toolbridge/build/build_request.hpp>
#include <toolbridge/task/task_engine.hpp>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

struct BuildTaskHandle {
    TaskId id;
    std::optional<int> debug_port;
    std::shared_future<TaskResult> result;
};

// Runs Gradle tasks of one project directory through the engine.
class GradleExecutionService {
public:
    static constexpr std::size_t kRecentLimit = 10;

    // gradle_executable is used when the project has no executable gradlew.
    GradleExecutionService(TaskExecutionEngine& engine, std::filesystem::path project_dir,
                           std::optional<std::filesystem::path> gradle_executable = std::nullopt);

    // Throws std::invalid_argument for an empty task path and
    // std::runtime_error when debugging is requested but no port is free.
    BuildTaskHandle run_task(const BuildTaskRequest& req);

    std::vector<TaskId> running_tasks() const;
    // Ids of tasks started here that were unfinished at the last run_task().
    std::size_t tracked_count() const;
    // Cancels every task started here that has not finished; returns their ids.
    std::vector<TaskId> stop_all_running_tasks();
    // Newest first, at most kRecentLimit.
    std::vector<BuildTaskRequest> recent_requests() const;

    const std::filesystem::path& project_dir() const { return m_project_dir; }
    // <project>/gradlew when executable, else the configured gradle, else "gradle".
    std::string launcher() const;
    CommandInvocation make_invocation(const BuildTaskRequest& req, std::optional<int> debug_port) const;
private:
    TaskExecutionEngine& m_engine;
    std::filesystem::path m_project_dir;
    std::optional<std::filesystem::path> m_gradle;
    mutable std::mutex m_mutex;
    std::vector<TaskId> m_submitted;
    std::deque<BuildTaskRequest> m_recent;
};

} // namespace toolbridge
