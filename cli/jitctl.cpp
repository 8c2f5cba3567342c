/*
 * jitstream - Client tool (jitctl)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/config.hpp"
#include "jitstream/logger.hpp"
#include "jitstream/server.hpp"
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace jitstream;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "jitstream client v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options] <command> <args...>\n\n";
    std::cout << "Commands:\n";
    std::cout << "  register <udid> <address>     record a device and the address it connects from\n";
    std::cout << "  launch <address> <bundle-id>  queue a launch for the daemon\n";
    std::cout << "  run <address> <bundle-id>     launch and attach now, in this process\n";
    std::cout << "  apps <address>                installed apps a debugger may attach to\n";
    std::cout << "  status <address>              mount and launch queue status\n";
    std::cout << "  release <address>             drop the device from the multiplexer\n\n";
    std::cout << "Options:\n";
    std::cout << "  --db <path>            database (JITSTREAM_DB)\n";
    std::cout << "  --pairing-dir <dir>    pairing records (JITSTREAM_PAIRING_DIR)\n";
    std::cout << "  --mux-socket <path>    multiplexer socket (JITSTREAM_MUX_SOCKET)\n";
    std::cout << "  --tunneld <url>        tunnel directory (JITSTREAM_TUNNELD_URL)\n";
    std::cout << "  --detach-commands <n>  detach packets sent after attach\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "  -v, --version          Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  JITSTREAM_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
}

int report(const LaunchResponse& response) {
    if (response.ok) {
        std::cout << response.message;
        if (response.pid != 0) {
            std::cout << " (pid " << response.pid << ")";
        }
        std::cout << "\n";
        return 0;
    }
    if (response.mountingRequired) {
        std::cout << response.message << "\n";
        return 2;
    }
    std::cerr << "Error: " << response.message << "\n";
    return 1;
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; JITSTREAM_LOG_LEVEL overrides
    if (!Logger::initFromEnv())
        Logger::setLevel(LogLevel::WARN);

    Config config = Config::fromEnv();
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
        if (arg.rfind("-", 0) == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " needs a value\n";
                return 1;
            }
            std::string error;
            if (!config.applyFlag(arg, argv[++i], error)) {
                std::cerr << "Error: " << error << "\n";
                return 1;
            }
            continue;
        }
        positional.push_back(arg);
    }

    if (positional.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string& command = positional[0];
    std::size_t expected = (command == "register" || command == "launch" || command == "run") ? 3 : 2;
    if (positional.size() != expected) {
        std::cerr << "Error: wrong number of arguments for " << command << "\n";
        printUsage(argv[0]);
        return 1;
    }

    std::signal(SIGPIPE, SIG_IGN);

    try {
        Runtime runtime(config);
        std::string error;
        if (!runtime.start(error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }

        if (command == "register") {
            if (!runtime.registry().registerDevice(positional[1], positional[2], error)) {
                std::cerr << "Error: " << error << "\n";
                return 1;
            }
            std::cout << "Registered " << positional[1] << "\n";
            return 0;
        }
        if (command == "launch") {
            return report(runtime.service().enqueueLaunch(positional[1], positional[2]));
        }
        if (command == "run") {
            int rc = report(runtime.service().launchApp(positional[1], positional[2]));
            runtime.orchestrator().flush();
            return rc;
        }
        if (command == "apps") {
            AppsResponse apps = runtime.service().listApps(positional[1]);
            runtime.orchestrator().flush();
            if (!apps) {
                std::cerr << "Error: " << apps.message << "\n";
                return 1;
            }
            for (const auto& bundle : apps.bundleIds) {
                std::cout << bundle << "\n";
            }
            return 0;
        }
        if (command == "status") {
            StatusReport status = runtime.service().status(positional[1]);
            std::cout << status.message << "\n";
            return status.mount.state == QueueState::BackendError ||
                   status.launch.state == QueueState::BackendError ? 1 : 0;
        }
        if (command == "release") {
            return report(runtime.service().release(positional[1]));
        }

        std::cerr << "Error: unknown command " << command << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
