/*
 * Gradle task execution service - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/build/gradle_service.hpp>
#include <toolbridge/build/gradle_progress.hpp>
#include <toolbridge/exec/path.hpp>
#include <toolbridge/util/log.hpp>
#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

namespace toolbridge {

GradleExecutionService::GradleExecutionService(TaskExecutionEngine& engine, fs::path project_dir,
                                               std::optional<fs::path> gradle_executable)
    : m_engine(engine), m_project_dir(std::move(project_dir)), m_gradle(std::move(gradle_executable)) {}

std::string GradleExecutionService::launcher() const {
    fs::path wrapper = m_project_dir / "gradlew";
    if (is_executable(wrapper.string())) return wrapper.string();
    if (m_gradle) return m_gradle->string();
    return "gradle";
}

CommandInvocation GradleExecutionService::make_invocation(const BuildTaskRequest& req, std::optional<int> debug_port) const {
    CommandBuilder b(launcher());
    b.arg(req.task_path).args(build_arguments(req));
    if (debug_port) b.args(debug_arguments(*debug_port));
    for (auto &kv : req.environment) b.env(kv.first, kv.second);
    return b.working_dir(m_project_dir).timeout(req.timeout).build();
}

BuildTaskHandle GradleExecutionService::run_task(const BuildTaskRequest& req) {
    if (req.task_path.empty()) throw std::invalid_argument("gradle task path is empty");
    BuildTaskHandle handle;
    TaskRequest tr;
    tr.name = req.task_path;
    if (req.debug) {
        handle.debug_port = find_free_port();
        tr.start_notes.push_back(StatusNote{message_keys::kDebugStarted, {req.task_path, std::to_string(*handle.debug_port)}});
        log::info("gradle", req.task_path + " waits for a debugger on port " + std::to_string(*handle.debug_port));
    }
    tr.command = make_invocation(req, handle.debug_port);
    tr.progress = std::make_shared<GradleProgressParser>();

    handle.id = m_engine.submit(std::move(tr));
    auto fut = m_engine.result(handle.id);
    if (fut) handle.result = *fut;

    std::lock_guard<std::mutex> lk(m_mutex);
    // Finished ids are dropped; the engine only keeps recent ones anyway.
    m_submitted.erase(std::remove_if(m_submitted.begin(), m_submitted.end(), [this](const TaskId& id) {
        auto st = m_engine.state(id);
        return !st || is_terminal(*st);
    }), m_submitted.end());
    m_submitted.push_back(handle.id);
    m_recent.push_front(req);
    while (m_recent.size() > kRecentLimit) m_recent.pop_back();
    return handle;
}

std::vector<TaskId> GradleExecutionService::running_tasks() const {
    std::vector<TaskId> out;
    std::lock_guard<std::mutex> lk(m_mutex);
    for (auto &id : m_submitted) {
        auto st = m_engine.state(id);
        if (st && !is_terminal(*st)) out.push_back(id);
    }
    return out;
}

std::size_t GradleExecutionService::tracked_count() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_submitted.size();
}

std::vector<TaskId> GradleExecutionService::stop_all_running_tasks() {
    std::vector<TaskId> stopped;
    for (auto &id : running_tasks()) {
        if (m_engine.cancel(id)) stopped.push_back(id);
    }
    if (!stopped.empty()) log::info("gradle", "stopping " + std::to_string(stopped.size()) + " running tasks");
    return stopped;
}

std::vector<BuildTaskRequest> GradleExecutionService::recent_requests() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return std::vector<BuildTaskRequest>(m_recent.begin(), m_recent.end());
}

} // namespace toolbridge
