/*
 * Gradle build model (task catalog) - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/build/gradle_model.hpp>
#include <toolbridge/util/log.hpp>
#include <algorithm>

namespace toolbridge {

namespace {

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

bool is_rule(const std::string& s) {
    return s.size() >= 3 && s.find_first_not_of('-') == std::string::npos;
}

} // namespace

const GradleTask* GradleBuildModel::find(const std::string& path) const {
    auto it = std::find_if(tasks.begin(), tasks.end(), [&](const GradleTask& t){ return t.path == path; });
    return it == tasks.end() ? nullptr : &*it;
}

std::vector<std::string> GradleBuildModel::groups() const {
    std::vector<std::string> out;
    for (auto &t : tasks) {
        if (std::find(out.begin(), out.end(), t.group) == out.end()) out.push_back(t.group);
    }
    return out;
}

GradleBuildModel parse_task_listing(const std::vector<std::string>& raw) {
    std::vector<std::string> lines;
    lines.reserve(raw.size());
    for (auto &l : raw) lines.push_back(trim(l));

    GradleBuildModel model;
    bool in_group = false;
    std::string group;
    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (line.empty() || is_rule(line)) continue;
        if (i + 1 < lines.size() && is_rule(lines[i + 1])) {
            // Section header.
            static const std::string runnable = "Tasks runnable from ";
            if (line.rfind(runnable, 0) == 0) {
                auto q1 = line.find('\''), q2 = line.rfind('\'');
                if (q1 != std::string::npos && q2 > q1) model.root_project = line.substr(q1 + 1, q2 - q1 - 1);
                in_group = false;
            } else if (line == "Rules") {
                in_group = false;
            } else {
                group = line;
                static const std::string suffix = " tasks";
                if (group.size() > suffix.size() && group.compare(group.size() - suffix.size(), suffix.size(), suffix) == 0)
                    group.erase(group.size() - suffix.size());
                if (group == "Other") group.clear();
                in_group = true;
            }
            ++i;
            continue;
        }
        if (!in_group) continue;
        std::string name = line, description;
        auto dash = line.find(" - ");
        if (dash != std::string::npos) {
            name = line.substr(0, dash);
            description = trim(line.substr(dash + 3));
        }
        if (name.empty() || name.find_first_of(" \t") != std::string::npos) continue;
        GradleTask t;
        t.path = name.front() == ':' ? name : ":" + name;
        t.name = name.substr(name.rfind(':') == std::string::npos ? 0 : name.rfind(':') + 1);
        t.group = group;
        t.description = description;
        model.tasks.push_back(std::move(t));
    }
    return model;
}

GradleModelService::GradleModelService(const ProcessRunner& runner, const GradleExecutionService& executor,
                                       std::chrono::milliseconds timeout)
    : m_runner(runner), m_executor(executor), m_timeout(timeout), m_model([this] { return load(); }) {}

GradleBuildModel GradleModelService::load() const {
    auto inv = CommandBuilder(m_executor.launcher())
        .args({"tasks", "--all", "--console=plain"})
        .working_dir(m_executor.project_dir())
        .timeout(m_timeout)
        .build();
    auto r = m_runner.run(inv);
    if (r.spawn_error) throw GradleError("gradle could not start: " + *r.spawn_error);
    if (r.timed_out) throw GradleError("gradle tasks timed out");
    if (r.cancelled) throw GradleError("gradle tasks was cancelled");
    if (r.exit_code != 0) throw GradleError("gradle tasks failed: " + r.stderr_text());
    auto model = parse_task_listing(r.stdout_lines);
    log::debug("gradle", "loaded " + std::to_string(model.tasks.size()) + " tasks of " + model.root_project);
    return model;
}

} // namespace toolbridge
