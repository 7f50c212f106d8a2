/*
 * Gradle build model (task catalog) - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <toolbridge/build/gradle_service.hpp>
#include <toolbridge/exec/process_runner.hpp>
#include <toolbridge/task/model_refresher.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolbridge {

class GradleError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct GradleTask {
    std::string path;  // ":app:compileJava"
    std::string name;  // "compileJava"
    std::string group; // "Build", empty for ungrouped
    std::string description;

    bool operator==(const GradleTask& o) const {
        return path == o.path && name == o.name && group == o.group && description == o.description;
    }
};

struct GradleBuildModel {
    std::string root_project;
    std::vector<GradleTask> tasks;

    const GradleTask* find(const std::string& path) const;
    std::vector<std::string> groups() const; // in listing order
};

// Parses `gradle tasks --all --console=plain` output.
GradleBuildModel parse_task_listing(const std::vector<std::string>& lines);

// Loads the build model in the background; see ModelRefresher for the
// force/cache rules.
class GradleModelService {
public:
    using ModelPtr = std::shared_ptr<const GradleBuildModel>;

    GradleModelService(const ProcessRunner& runner, const GradleExecutionService& executor,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(120000));

    // The future throws GradleError when the listing cannot be produced.
    std::shared_future<ModelPtr> refresh_model(bool force = false) { return m_model.refresh(force); }
    ModelPtr cached_model() const { return m_model.cached(); }

    SubscriptionId subscribe(ModelRefresher<GradleBuildModel>::Listener fn) { return m_model.subscribe(std::move(fn)); }
    bool unsubscribe(SubscriptionId id) { return m_model.unsubscribe(id); }
private:
    GradleBuildModel load() const;

    const ProcessRunner& m_runner;
    const GradleExecutionService& m_executor;
    std::chrono::milliseconds m_timeout;
    ModelRefresher<GradleBuildModel> m_model;
};

} // namespace toolbridge
