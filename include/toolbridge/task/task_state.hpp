/*
 * Task lifecycle states - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace toolbridge {

// Queued -> Starting -> Running -> {Completed | Failed | Cancelled}
enum class TaskState { Queued, Starting, Running, Completed, Failed, Cancelled };

const char* to_string(TaskState s);
bool is_terminal(TaskState s);
// True when `to` is a legal successor of `from`.
bool can_transition(TaskState from, TaskState to);

} // namespace toolbridge
