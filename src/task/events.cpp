/*
 * Task identifiers and lifecycle events - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/task/events.hpp>
#include <cstdio>
#include <mutex>
#include <random>

namespace toolbridge {

TaskId TaskId::generate() {
    static std::mutex mtx;
    static std::mt19937_64 rng{[] {
        std::random_device rd;
        return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
    }()};
    std::lock_guard<std::mutex> lk(mtx);
    std::uint64_t hi = rng(), lo = rng();
    hi = (hi & ~0xF000ULL) | 0x4000ULL;                               // version 4
    lo = (lo & ~(0xC000000000000000ULL)) | 0x8000000000000000ULL;     // RFC 4122 variant
    return TaskId(hi, lo);
}

std::string TaskId::to_string() const {
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(m_hi >> 32),
                  static_cast<unsigned>((m_hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(m_hi & 0xFFFF),
                  static_cast<unsigned>(m_lo >> 48),
                  static_cast<unsigned long long>(m_lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

const TaskId& event_task(const TaskEvent& e) {
    return std::visit([](auto &ev) -> const TaskId& { return ev.task; }, e);
}

TaskState event_state(const TaskEvent& e) {
    return std::visit([](auto &ev) { return ev.state; }, e);
}

} // namespace toolbridge
