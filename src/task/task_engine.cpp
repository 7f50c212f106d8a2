/*
 * Asynchronous task execution engine - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/task/task_engine.hpp>
#include <toolbridge/util/log.hpp>
#include <algorithm>
#include <system_error>

namespace toolbridge {

// Forwards runner callbacks as task events from the worker thread.
class TaskExecutionEngine::ProgressTracker : public OutputListener {
public:
    ProgressTracker(TaskExecutionEngine& engine, Task& task) : m_engine(engine), m_task(task) {}

    void on_started(pid_t pid) override {
        m_engine.move_to(m_task, TaskState::Running, message_keys::kRunning, {m_task.request.name, std::to_string(pid)});
    }

    void on_output(OutputStream stream, const std::string& chunk) override {
        m_engine.m_bus.publish(OutputEvent{m_task.id, m_task.state.load(), stream, chunk});
        if (!m_task.request.progress) return;
        auto upd = m_task.request.progress->parse(chunk);
        if (!upd) return;
        // A lower value than the last one is reported as the last one.
        double f = m_task.last_fraction;
        if (upd->fraction) f = std::max(f, std::clamp(*upd->fraction, 0.0, 1.0));
        m_task.last_fraction = f;
        ProgressEvent ev{m_task.id, m_task.state.load(), {}, {}, f, std::chrono::system_clock::now()};
        switch (upd->kind) {
            case ProgressUpdate::Kind::Percentage:
                ev.message_key = message_keys::kProgressPercentage;
                ev.args = {upd->phase, std::to_string(upd->percent.value_or(0))};
                break;
            case ProgressUpdate::Kind::Phase:
                ev.message_key = message_keys::kProgressPhase;
                ev.args = {upd->phase};
                break;
            case ProgressUpdate::Kind::Message:
                ev.message_key = message_keys::kProgressMessage;
                ev.args = {upd->text};
                break;
        }
        m_engine.m_bus.publish(ev);
    }
private:
    TaskExecutionEngine& m_engine;
    Task& m_task;
};

TaskExecutionEngine::TaskExecutionEngine(const ProcessRunner& runner) : m_runner(runner) {}

TaskExecutionEngine::~TaskExecutionEngine() {
    stop_all();
    wait_all();
}

TaskId TaskExecutionEngine::submit(TaskRequest request) {
    reap_finished();
    auto task = std::make_shared<Task>();
    task->id = TaskId::generate();
    task->request = std::move(request);
    task->future = task->promise.get_future().share();
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        while (m_tasks.count(task->id)) task->id = TaskId::generate();
        m_tasks.emplace(task->id, task);
    }
    log::debug("task", "queued " + task->id.to_string() + " " + task->request.name);
    m_bus.publish(StatusEvent{task->id, TaskState::Queued, message_keys::kQueued, {task->request.name}});
    try {
        // The worker is attached under the lock so wait_all() never sees a half-built task.
        std::lock_guard<std::mutex> lk(m_mutex);
        task->worker = std::thread([this, task] {
            run_task(task);
            std::lock_guard<std::mutex> done(m_mutex);
            m_finished.push_back(task->id);
        });
    } catch (const std::system_error& e) {
        log::error("task", "cannot start worker for " + task->request.name + ": " + e.what());
        move_to(*task, TaskState::Cancelled, message_keys::kCancelled, {task->request.name});
        TaskResult r;
        r.error = std::string("no worker thread: ") + e.what();
        finish(*task, std::move(r));
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            retain(task->id);
        }
        throw;
    }
    return task->id;
}

bool TaskExecutionEngine::cancel(const TaskId& id) {
    std::shared_ptr<Task> task;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        auto it = m_tasks.find(id);
        if (it == m_tasks.end()) return false;
        task = it->second;
    }
    if (is_terminal(task->state.load())) return false;
    task->token.cancel();
    log::debug("task", "cancel requested for " + id.to_string());
    return true;
}

std::size_t TaskExecutionEngine::stop_all() {
    std::size_t n = 0;
    for (auto &id : running_tasks()) if (cancel(id)) ++n;
    return n;
}

void TaskExecutionEngine::wait_all() {
    std::lock_guard<std::mutex> join_lk(m_join_mutex);
    std::vector<std::shared_ptr<Task>> tasks;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        for (auto &kv : m_tasks) if (kv.second->worker.joinable()) tasks.push_back(kv.second);
    }
    for (auto &t : tasks) {
        if (t->worker.get_id() != std::this_thread::get_id()) t->worker.join();
    }
    std::lock_guard<std::mutex> lk(m_mutex);
    // Workers started after the snapshot are still joinable; the next reap takes them.
    std::vector<TaskId> keep;
    for (auto &id : m_finished) {
        auto it = m_tasks.find(id);
        if (it != m_tasks.end() && it->second->worker.joinable()) keep.push_back(id);
        else retain(id);
    }
    m_finished.swap(keep);
}

void TaskExecutionEngine::reap_finished() {
    // wait_all() is joining; the next submit reaps instead.
    std::unique_lock<std::mutex> join_lk(m_join_mutex, std::try_to_lock);
    if (!join_lk.owns_lock()) return;
    std::vector<std::shared_ptr<Task>> done;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        for (auto &id : m_finished) {
            auto it = m_tasks.find(id);
            if (it != m_tasks.end()) done.push_back(it->second);
        }
        m_finished.clear();
    }
    // Each of these has left run_task, so join only waits for the thread to exit.
    for (auto &t : done) {
        if (t->worker.joinable() && t->worker.get_id() != std::this_thread::get_id()) t->worker.join();
    }
    std::lock_guard<std::mutex> lk(m_mutex);
    for (auto &t : done) {
        if (t->worker.joinable()) m_finished.push_back(t->id);
        else retain(t->id);
    }
}

void TaskExecutionEngine::retain(const TaskId& id) {
    m_retained.push_back(id);
    while (m_retained.size() > kRetainedTasks) {
        m_tasks.erase(m_retained.front());
        m_retained.pop_front();
    }
}

std::optional<TaskState> TaskExecutionEngine::state(const TaskId& id) const {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) return std::nullopt;
    return it->second->state.load();
}

std::optional<std::shared_future<TaskResult>> TaskExecutionEngine::result(const TaskId& id) const {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) return std::nullopt;
    return it->second->future;
}

std::size_t TaskExecutionEngine::tracked_tasks() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_tasks.size();
}

std::vector<TaskId> TaskExecutionEngine::running_tasks() const {
    std::vector<TaskId> ids;
    std::lock_guard<std::mutex> lk(m_mutex);
    for (auto &kv : m_tasks) if (!is_terminal(kv.second->state.load())) ids.push_back(kv.first);
    return ids;
}

void TaskExecutionEngine::move_to(Task& task, TaskState to, const std::string& key, std::vector<std::string> args) {
    TaskState from = task.state.load();
    if (!can_transition(from, to)) {
        log::warn("task", std::string("ignored transition ") + to_string(from) + " -> " + to_string(to));
        return;
    }
    task.state.store(to);
    log::debug("task", task.id.to_string() + " " + to_string(from) + " -> " + to_string(to));
    m_bus.publish(StatusEvent{task.id, to, key, std::move(args)});
}

void TaskExecutionEngine::finish(Task& task, TaskResult result) {
    result.id = task.id;
    result.state = task.state.load();
    task.promise.set_value(std::move(result));
}

void TaskExecutionEngine::run_task(const std::shared_ptr<Task>& task) {
    const std::string& name = task->request.name;
    auto cancelled = [&] {
        move_to(*task, TaskState::Cancelled, message_keys::kCancelled, {name});
        finish(*task, TaskResult{});
    };
    if (task->token.is_cancelled()) { cancelled(); return; }

    move_to(*task, TaskState::Starting, message_keys::kStarting, {name});
    for (auto &note : task->request.start_notes)
        m_bus.publish(StatusEvent{task->id, TaskState::Starting, note.message_key, note.args});
    if (task->token.is_cancelled()) { cancelled(); return; }

    ProgressTracker tracker(*this, *task);
    ExecutionResult r = m_runner.run(task->request.command, &tracker, &task->token);

    TaskResult out;
    out.exit_code = r.exit_code;
    out.output = std::move(r.stdout_lines);
    out.error_output = std::move(r.stderr_lines);
    out.timed_out = r.timed_out;
    out.duration = r.duration;

    if (r.cancelled) {
        move_to(*task, TaskState::Cancelled, message_keys::kCancelled, {name});
        finish(*task, std::move(out));
        return;
    }
    if (!r.spawn_error && !r.timed_out && r.exit_code == 0) {
        move_to(*task, TaskState::Completed, message_keys::kCompleted, {name, "0"});
        finish(*task, std::move(out));
        return;
    }

    std::string msg;
    if (r.spawn_error) msg = "failed to start: " + *r.spawn_error;
    else if (r.timed_out) msg = "timed out after " + std::to_string(task->request.command.timeout.count()) + "ms";
    else msg = "exited with code " + std::to_string(r.exit_code);
    log::debug("task", name + " " + msg);
    out.error = msg;
    // Error event first, then the terminal status event.
    TaskState from = task->state.load();
    if (!can_transition(from, TaskState::Failed)) {
        log::warn("task", std::string("cannot fail from ") + to_string(from));
        finish(*task, std::move(out));
        return;
    }
    task->state.store(TaskState::Failed);
    m_bus.publish(ErrorEvent{task->id, TaskState::Failed, msg});
    m_bus.publish(StatusEvent{task->id, TaskState::Failed, message_keys::kFailed, {name, std::to_string(r.exit_code)}});
    finish(*task, std::move(out));
}

} // namespace toolbridge
