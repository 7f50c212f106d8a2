/*
 * Task identifiers and lifecycle events - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <toolbridge/exec/process_runner.hpp>
#include <toolbridge/task/task_state.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace toolbridge {

// 128-bit random identifier, printed as a version 4 UUID.
class TaskId {
public:
    TaskId() = default;
    TaskId(std::uint64_t hi, std::uint64_t lo) : m_hi(hi), m_lo(lo) {}
    static TaskId generate();

    std::string to_string() const;
    bool is_nil() const { return m_hi == 0 && m_lo == 0; }
    std::uint64_t high() const { return m_hi; }
    std::uint64_t low() const { return m_lo; }

    bool operator==(const TaskId& o) const { return m_hi == o.m_hi && m_lo == o.m_lo; }
    bool operator!=(const TaskId& o) const { return !(*this == o); }
    bool operator<(const TaskId& o) const { return m_hi != o.m_hi ? m_hi < o.m_hi : m_lo < o.m_lo; }
private:
    std::uint64_t m_hi = 0;
    std::uint64_t m_lo = 0;
};

// Message keys carried by status and progress events.
namespace message_keys {
inline constexpr const char* kQueued = "toolbridge.task.queued";
inline constexpr const char* kStarting = "toolbridge.task.starting";
inline constexpr const char* kRunning = "toolbridge.task.running";
inline constexpr const char* kCompleted = "toolbridge.task.completed";
inline constexpr const char* kFailed = "toolbridge.task.failed";
inline constexpr const char* kCancelled = "toolbridge.task.cancelled";
inline constexpr const char* kDebugStarted = "toolbridge.task.debug_started";
inline constexpr const char* kProgressMessage = "toolbridge.progress.message";
inline constexpr const char* kProgressPhase = "toolbridge.progress.phase";
inline constexpr const char* kProgressPercentage = "toolbridge.progress.percentage";
}

struct StatusEvent {
    TaskId task;
    TaskState state;
    std::string message_key;
    std::vector<std::string> args;
};

struct ProgressEvent {
    TaskId task;
    TaskState state;
    std::string message_key;
    std::vector<std::string> args;
    double fraction = 0.0; // [0.0, 1.0], never decreasing within a task
    std::chrono::system_clock::time_point timestamp;
};

struct OutputEvent {
    TaskId task;
    TaskState state;
    OutputStream stream;
    std::string text;
};

struct ErrorEvent {
    TaskId task;
    TaskState state;
    std::string message;
};

using TaskEvent = std::variant<StatusEvent, ProgressEvent, OutputEvent, ErrorEvent>;

const TaskId& event_task(const TaskEvent& e);
TaskState event_state(const TaskEvent& e);

} // namespace toolbridge

namespace std {
template <>
struct hash<toolbridge::TaskId> {
    size_t operator()(const toolbridge::TaskId& id) const noexcept {
        return hash<uint64_t>{}(id.high() ^ (id.low() * 0x9e3779b97f4a7c15ULL));
    }
};
} // namespace std
