/*
 * Build task descriptor - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/build/build_request.hpp>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace toolbridge {

const char* to_string(ConsoleMode m) {
    switch (m) {
        case ConsoleMode::Rich: return "rich";
        case ConsoleMode::Plain: return "plain";
        case ConsoleMode::Quiet: return "quiet";
    }
    return "plain";
}

std::optional<ConsoleMode> parse_console_mode(const std::string& s) {
    if (s == "rich") return ConsoleMode::Rich;
    if (s == "plain") return ConsoleMode::Plain;
    if (s == "quiet") return ConsoleMode::Quiet;
    return std::nullopt;
}

std::vector<std::string> build_arguments(const BuildTaskRequest& req) {
    std::vector<std::string> args(req.args);
    if (req.offline) args.push_back("--offline");
    if (req.refresh_dependencies) args.push_back("--refresh-dependencies");
    switch (req.console) {
        case ConsoleMode::Rich: args.push_back("--console=rich"); break;
        case ConsoleMode::Plain: args.push_back("--console=plain"); break;
        case ConsoleMode::Quiet: args.push_back("--quiet"); break;
    }
    for (auto &kv : req.system_properties) args.push_back("-D" + kv.first + "=" + kv.second);
    return args;
}

std::vector<std::string> debug_arguments(int port) {
    return {"-Dorg.gradle.debug=true", "-Dorg.gradle.debug.port=" + std::to_string(port)};
}

int find_free_port() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) throw std::runtime_error(std::string("socket: ") + std::strerror(errno));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        int e = errno;
        close(fd);
        throw std::runtime_error(std::string("no free port for debugging: ") + std::strerror(e));
    }
    close(fd);
    return ntohs(addr.sin_port);
}

} // namespace toolbridge
