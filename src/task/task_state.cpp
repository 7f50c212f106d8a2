/*
 * Task lifecycle states - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/task/task_state.hpp>

namespace toolbridge {

const char* to_string(TaskState s) {
    switch (s) {
        case TaskState::Queued: return "queued";
        case TaskState::Starting: return "starting";
        case TaskState::Running: return "running";
        case TaskState::Completed: return "completed";
        case TaskState::Failed: return "failed";
        case TaskState::Cancelled: return "cancelled";
    }
    return "?";
}

bool is_terminal(TaskState s) {
    return s == TaskState::Completed || s == TaskState::Failed || s == TaskState::Cancelled;
}

bool can_transition(TaskState from, TaskState to) {
    if (is_terminal(from)) return false;
    switch (to) {
        case TaskState::Queued: return false;
        case TaskState::Starting: return from == TaskState::Queued;
        case TaskState::Running: return from == TaskState::Starting;
        case TaskState::Completed: return from == TaskState::Running;
        case TaskState::Failed: return from == TaskState::Starting || from == TaskState::Running;
        case TaskState::Cancelled: return true;
    }
    return false;
}

} // namespace toolbridge
