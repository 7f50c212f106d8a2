/*
 * ToolBridge command line front end
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/build/gradle_model.hpp>
#include <toolbridge/build/gradle_service.hpp>
#include <toolbridge/exec/locator.hpp>
#include <toolbridge/exec/process_runner.hpp>
#include <toolbridge/task/task_engine.hpp>
#include <toolbridge/util/config.hpp>
#include <toolbridge/util/log.hpp>
#include <toolbridge/vcs/change_tree.hpp>
#include <toolbridge/vcs/git_client.hpp>
#include <toolbridge/vcs/repository_service.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace toolbridge;

static volatile sig_atomic_t g_interrupted = 0;
static void sigint_handler(int){ g_interrupted = 1; }

static void usage(){
    std::cerr << "usage: toolbridge [-d|--debug] <command> [args]\n"
              << "  locate <tool>                         find an executable (git, gradle, ...)\n"
              << "  status [dir]                          git branch and grouped changes\n"
              << "  fetch [dir]                           git fetch --prune with progress\n"
              << "  tasks [dir]                           Gradle tasks of the project\n"
              << "  run [--offline] [--rich|--plain|--quiet] [--debug-jvm] <task> [args...]\n"
              << "  exec [--timeout ms] [--] <cmd> [args...]\n";
}

static std::string git_executable(const Config& cfg, const ProcessRunner& runner){
    if (cfg.git_executable) return *cfg.git_executable;
    ExecutableLocator locator(runner);
    auto p = locator.locate("git", cfg.probe_timeout);
    return p ? p->string() : std::string("git");
}

static std::optional<fs::path> gradle_executable(const Config& cfg, const ProcessRunner& runner){
    if (cfg.gradle_executable) return fs::path(*cfg.gradle_executable);
    ExecutableLocator locator(runner);
    return locator.locate("gradle", cfg.probe_timeout);
}

static void print_tree(const ChangeNode& node, int depth){
    std::string indent(static_cast<size_t>(depth) * 2, ' ');
    if (node.is_file()) {
        const auto &c = node.changes.front();
        std::cout << indent << c.status_code() << ' ' << node.label;
        if (c.old_path) std::cout << " (from " << c.old_path->filename().string() << ")";
        std::cout << "\n";
        return;
    }
    if (node.kind != ChangeNode::Kind::Root)
        std::cout << indent << node.label << "/ (" << node.file_count() << ")\n";
    for (auto &child : node.children) print_tree(*child, node.kind == ChangeNode::Kind::Root ? depth : depth + 1);
}

static int cmd_locate(const Config& cfg, const std::vector<std::string>& args){
    if (args.size() != 1) { usage(); return 2; }
    ProcessRunner runner;
    ExecutableLocator locator(runner);
    auto p = locator.locate(args[0], cfg.probe_timeout);
    if (!p) { std::cerr << args[0] << ": not found\n"; return 1; }
    std::cout << p->string() << "\n";
    return 0;
}

static int cmd_status(const Config& cfg, const std::vector<std::string>& args){
    fs::path dir = args.empty() ? fs::current_path() : fs::path(args[0]);
    ProcessRunner runner;
    GitClient client(runner, GitCommands(git_executable(cfg, runner), cfg.git_timeouts()));
    GitRepositoryService service(client, dir);
    if (!service.detect()) { std::cerr << dir.string() << ": not a git repository\n"; return 1; }
    auto status = service.refresh_status(true).get();
    std::cout << "On branch " << status->branch;
    if (status->ahead || status->behind) std::cout << " [ahead " << status->ahead << ", behind " << status->behind << "]";
    std::cout << "\n";
    ChangeTreeBuilder builder;
    auto update = builder.build(service.repository()->root, status->changes);
    if (!update.has_changes) { std::cout << "nothing to commit, working tree clean\n"; return 0; }
    print_tree(*update.root, 0);
    return 0;
}

static int cmd_fetch(const Config& cfg, const std::vector<std::string>& args){
    fs::path dir = args.empty() ? fs::current_path() : fs::path(args[0]);
    ProcessRunner runner;
    GitClient client(runner, GitCommands(git_executable(cfg, runner), cfg.git_timeouts()));
    GitRepositoryService service(client, dir);
    if (!service.detect()) { std::cerr << dir.string() << ": not a git repository\n"; return 1; }
    service.fetch([](const ProgressUpdate& u){
        if (u.kind == ProgressUpdate::Kind::Percentage && u.percent)
            std::cerr << "\r" << u.phase << ": " << *u.percent << "%" << std::flush;
        else if (!u.text.empty())
            std::cerr << "\n[" << u.phase << "] " << u.text;
    });
    std::cerr << "\n";
    auto status = service.cached_status();
    if (status) std::cout << status->branch << ": ahead " << status->ahead << ", behind " << status->behind << "\n";
    return 0;
}

static int cmd_tasks(const Config& cfg, const std::vector<std::string>& args){
    fs::path dir = args.empty() ? fs::current_path() : fs::path(args[0]);
    ProcessRunner runner;
    TaskExecutionEngine engine(runner);
    GradleExecutionService gradle(engine, dir, gradle_executable(cfg, runner));
    GradleModelService models(runner, gradle);
    auto model = models.refresh_model().get();
    if (!model->root_project.empty()) std::cout << "Project '" << model->root_project << "'\n";
    for (auto &group : model->groups()) {
        std::cout << (group.empty() ? std::string("Other") : group) << ":\n";
        for (auto &t : model->tasks) {
            if (t.group != group) continue;
            std::cout << "  " << t.path;
            if (!t.description.empty()) std::cout << " - " << t.description;
            std::cout << "\n";
        }
    }
    return 0;
}

// Waits for a task, cancelling it on SIGINT.
static TaskResult await(TaskExecutionEngine& engine, const TaskId& id, const std::shared_future<TaskResult>& fut){
    while (fut.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (g_interrupted) { g_interrupted = 0; engine.cancel(id); }
    }
    return fut.get();
}

static void print_event(std::mutex& out_mutex, const TaskEvent& ev){
    std::lock_guard<std::mutex> lk(out_mutex);
    if (auto *o = std::get_if<OutputEvent>(&ev)) {
        (o->stream == OutputStream::Stdout ? std::cout : std::cerr) << o->text << "\n";
    } else if (auto *s = std::get_if<StatusEvent>(&ev)) {
        if (s->message_key == message_keys::kDebugStarted && !s->args.empty())
            std::cerr << "[RUN] listening for debugger on port " << s->args.back() << "\n";
        log::info("run", std::string(to_string(s->state)) + (s->args.empty() ? "" : " " + s->args.front()));
    } else if (auto *p = std::get_if<ProgressEvent>(&ev)) {
        log::debug("progress", std::to_string(static_cast<int>(p->fraction * 100)) + "% " + (p->args.empty() ? "" : p->args.back()));
    } else if (auto *e = std::get_if<ErrorEvent>(&ev)) {
        log::error("run", e->message);
    }
}

static int cmd_run(const Config& cfg, const std::vector<std::string>& args){
    BuildTaskRequest req;
    req.offline = cfg.gradle_offline;
    req.console = cfg.gradle_console;
    size_t i = 0;
    for (; i < args.size(); ++i) {
        const auto &a = args[i];
        if (a == "--offline") req.offline = true;
        else if (a == "--rich") req.console = ConsoleMode::Rich;
        else if (a == "--plain") req.console = ConsoleMode::Plain;
        else if (a == "--quiet") req.console = ConsoleMode::Quiet;
        else if (a == "--debug-jvm") req.debug = true;
        else if (a == "--refresh-dependencies") req.refresh_dependencies = true;
        else break;
    }
    if (i >= args.size()) { usage(); return 2; }
    req.task_path = args[i++];
    req.args.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());

    ProcessRunner runner;
    TaskExecutionEngine engine(runner);
    std::mutex out_mutex;
    engine.subscribe([&](const TaskEvent& ev){ print_event(out_mutex, ev); });
    GradleExecutionService gradle(engine, fs::current_path(), gradle_executable(cfg, runner));
    auto handle = gradle.run_task(req);
    auto result = await(engine, handle.id, handle.result);
    if (result.state == TaskState::Completed) return 0;
    if (result.state == TaskState::Cancelled) return 130;
    return result.exit_code > 0 ? result.exit_code : 1;
}

static int cmd_exec(const std::vector<std::string>& args){
    std::chrono::milliseconds timeout{0};
    size_t i = 0;
    for (; i < args.size(); ++i) {
        if (args[i] == "--timeout" && i + 1 < args.size()) {
            try { timeout = std::chrono::milliseconds(std::stol(args[++i])); }
            catch (const std::exception&) { std::cerr << "exec: bad timeout '" << args[i] << "'\n"; return 2; }
        } else if (args[i] == "--") { ++i; break; }
        else break;
    }
    if (i >= args.size()) { usage(); return 2; }
    auto inv = CommandBuilder(args[i])
        .args(std::vector<std::string>(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end()))
        .timeout(timeout)
        .build();

    ProcessRunner runner;
    TaskExecutionEngine engine(runner);
    std::mutex out_mutex;
    engine.subscribe([&](const TaskEvent& ev){ print_event(out_mutex, ev); });
    TaskRequest req;
    req.name = inv.display();
    req.command = inv;
    auto id = engine.submit(std::move(req));
    auto fut = engine.result(id);
    if (!fut) return 1;
    auto result = await(engine, id, *fut);
    if (result.state == TaskState::Cancelled) return 130;
    return result.exit_code < 0 ? 1 : result.exit_code;
}

int main(int argc, char* argv[]){
    std::signal(SIGINT, sigint_handler);
    Config cfg = load_config(default_config_path());
    log::set_level(cfg.log_level);

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (args.empty() && (a == "--debug" || a == "-d")) { log::set_level(log::Level::Debug); continue; }
        if (args.empty() && (a == "--help" || a == "-h")) { usage(); return 0; }
        args.push_back(a);
    }
    if (args.empty()) { usage(); return 2; }
    std::string cmd = args.front();
    args.erase(args.begin());

    try {
        if (cmd == "locate") return cmd_locate(cfg, args);
        if (cmd == "status") return cmd_status(cfg, args);
        if (cmd == "fetch") return cmd_fetch(cfg, args);
        if (cmd == "tasks") return cmd_tasks(cfg, args);
        if (cmd == "run") return cmd_run(cfg, args);
        if (cmd == "exec") return cmd_exec(args);
    } catch (const GitError& e) {
        log::error("git", e.what());
        return e.exit_code() > 0 ? e.exit_code() : 1;
    } catch (const std::exception& e) {
        log::error("toolbridge", e.what());
        return 1;
    }
    std::cerr << "unknown command: " << cmd << "\n";
    usage();
    return 2;
}
