/*
 * jitstream - Server daemon (jitstreamd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/config.hpp"
#include "jitstream/logger.hpp"
#include "jitstream/server.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>

using namespace jitstream;

namespace {
constexpr const char* kVersion = "0.1.0";

volatile std::sig_atomic_t g_stop = 0;

void onStopSignal(int) {
    g_stop = 1;
}

// Single-instance guard. Refuses a pid file whose owner is still alive and
// removes the file again when the daemon exits.
class PidFile final {
public:
    static std::unique_ptr<PidFile> claim(const std::filesystem::path& path, std::string& error) {
        std::ifstream existing(path);
        long owner = 0;
        if (existing >> owner && owner > 0 && owner != static_cast<long>(::getpid()) &&
            (::kill(static_cast<pid_t>(owner), 0) == 0 || errno == EPERM)) {
            error = "jitstreamd already running (pid " + std::to_string(owner) + ")";
            return nullptr;
        }
        existing.close();

        std::ofstream out(path, std::ios::trunc);
        if (!(out << ::getpid() << "\n")) {
            error = "cannot write " + path.string();
            return nullptr;
        }
        return std::unique_ptr<PidFile>(new PidFile(path));
    }

    ~PidFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    PidFile(const PidFile&) = delete;
    PidFile& operator=(const PidFile&) = delete;

private:
    explicit PidFile(std::filesystem::path path) : path_(std::move(path)) {}
    std::filesystem::path path_;
};

void printUsage() {
    std::cout << "jitstreamd " << kVersion << " - wireless JIT enabler daemon\n\n"
              << "Usage: jitstreamd [options]\n\n"
              << "  --db <path>              queue and device database (JITSTREAM_DB)\n"
              << "  --pairing-dir <dir>      pairing records (JITSTREAM_PAIRING_DIR)\n"
              << "  --mux-socket <path>      multiplexer socket (JITSTREAM_MUX_SOCKET)\n"
              << "  --tunneld <url>          tunnel directory (JITSTREAM_TUNNELD_URL)\n"
              << "  -w, --workers <n>        worker threads (JITSTREAM_WORKERS)\n"
              << "  --tunnel-attempts <n>    tunnel lookups before giving up\n"
              << "  --detach-commands <n>    detach packets sent after attach\n"
              << "  --pid-file <path>        write the daemon pid here\n"
              << "  -v, --version            print version\n"
              << "  -h, --help               this text\n";
}
}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();

    Config config = Config::fromEnv();
    std::filesystem::path pidPath;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << kVersion << "\n";
            return 0;
        }
        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " needs a value\n";
            return 1;
        }
        std::string value = argv[++i];
        if (arg == "--pid-file") {
            pidPath = value;
            continue;
        }
        std::string error;
        if (!config.applyFlag(arg, value, error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
    }

    std::unique_ptr<PidFile> pidFile;
    if (!pidPath.empty()) {
        std::string error;
        pidFile = PidFile::claim(pidPath, error);
        if (!pidFile) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
    }

    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);
    // Devices drop connections mid-write.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        Server server(config);
        if (!server.start()) {
            std::cerr << "Error: jitstreamd failed to start (see log)\n";
            return 1;
        }
        LOG_INFO("jitstreamd " + std::string(kVersion) + " serving " + config.database.string() + " with " +
                 std::to_string(config.workers) + " workers");

        while (!g_stop && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_INFO(g_stop ? "Stop signal received" : "Server stopped on its own");
        server.shutdown();
    } catch (const std::exception& e) {
        LOG_ERROR("jitstreamd: " + std::string(e.what()));
        return 1;
    }
    return 0;
}
