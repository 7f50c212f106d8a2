/*
 * Asynchronous task execution engine - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <toolbridge/exec/process_runner.hpp>
#include <toolbridge/task/event_bus.hpp>
#include <toolbridge/task/events.hpp>
#include <toolbridge/task/progress.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace toolbridge {

// Extra status event published with the Starting state (e.g. a debug port).
struct StatusNote {
    std::string message_key;
    std::vector<std::string> args;
};

struct TaskRequest {
    std::string name; // label used in status event args
    CommandInvocation command;
    std::shared_ptr<const ProgressParser> progress; // optional
    std::vector<StatusNote> start_notes;            // published right after the Starting transition
};

struct TaskResult {
    TaskId id;
    TaskState state = TaskState::Queued;
    int exit_code = -1;
    std::vector<std::string> output;
    std::vector<std::string> error_output;
    bool timed_out = false;
    std::chrono::milliseconds duration{0};
    std::optional<std::string> error; // set for Failed
};

class TaskExecutionEngine {
public:
    using Listener = std::function<void(const TaskEvent&)>;
    // Finished tasks kept queryable by state()/result() after their worker is joined.
    static constexpr std::size_t kRetainedTasks = 64;

    explicit TaskExecutionEngine(const ProcessRunner& runner);
    // Cancels whatever is still running and joins every worker.
    ~TaskExecutionEngine();
    TaskExecutionEngine(const TaskExecutionEngine&) = delete;
    TaskExecutionEngine& operator=(const TaskExecutionEngine&) = delete;

    // Emits Queued and starts a worker; returns immediately. Joins workers
    // that have finished since the last call. If no thread can be created the
    // task is cancelled and std::system_error propagates.
    TaskId submit(TaskRequest request);
    // False when the task is unknown or already terminal.
    bool cancel(const TaskId& id);
    // Cancels every non-terminal task, returns how many were signalled.
    std::size_t stop_all();
    void wait_all();

    std::optional<TaskState> state(const TaskId& id) const;
    std::optional<std::shared_future<TaskResult>> result(const TaskId& id) const;
    std::vector<TaskId> running_tasks() const;
    // Live tasks plus at most kRetainedTasks finished ones.
    std::size_t tracked_tasks() const;

    SubscriptionId subscribe(Listener fn) { return m_bus.subscribe(std::move(fn)); }
    bool unsubscribe(SubscriptionId id) { return m_bus.unsubscribe(id); }
private:
    struct Task {
        TaskId id;
        TaskRequest request;
        std::atomic<TaskState> state{TaskState::Queued};
        CancellationToken token;
        std::promise<TaskResult> promise;
        std::shared_future<TaskResult> future;
        std::thread worker;
        double last_fraction = 0.0; // worker thread only
    };
    class ProgressTracker;

    void run_task(const std::shared_ptr<Task>& task);
    void move_to(Task& task, TaskState to, const std::string& key, std::vector<std::string> args = {});
    void finish(Task& task, TaskResult result);
    void reap_finished();
    void retain(const TaskId& id); // m_mutex held

    const ProcessRunner& m_runner;
    EventBus<TaskEvent> m_bus;
    mutable std::mutex m_mutex;
    std::mutex m_join_mutex;
    std::map<TaskId, std::shared_ptr<Task>> m_tasks;
    std::vector<TaskId> m_finished; // worker returned, not joined yet
    std::deque<TaskId> m_retained;  // joined, oldest first
};

} // namespace toolbridge
