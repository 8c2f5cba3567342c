/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/config.hpp"
#include "jitstream/logger.hpp"
#include <cstdlib>
#include <stdexcept>

namespace jitstream {

namespace {
int env_int(const char* name, int defv, int minv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        int parsed = std::stoi(val);
        if (parsed < minv) {
            LOG_WARN(std::string(name) + " below minimum, using " + std::to_string(defv));
            return defv;
        }
        return parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring non-numeric ") + name + "=" + val);
        return defv;
    }
}

std::string env_str(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : defv;
}

bool parse_int(const std::string& value, int minv, int& out) {
    try {
        std::size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size() || parsed < minv) {
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}
}

Config Config::fromEnv() {
    Config config;
    config.database = env_str("JITSTREAM_DB", config.database.string());
    config.pairingDir = env_str("JITSTREAM_PAIRING_DIR", config.pairingDir.string());
    config.muxSocket = env_str("JITSTREAM_MUX_SOCKET", config.muxSocket);
    config.tunneldUrl = env_str("JITSTREAM_TUNNELD_URL", config.tunneldUrl);
    config.label = env_str("JITSTREAM_LABEL", config.label);

    config.workers = env_int("JITSTREAM_WORKERS", config.workers, 1);
    config.tunnelAttempts = env_int("JITSTREAM_TUNNEL_ATTEMPTS", config.tunnelAttempts, 1);
    config.tunnelInterval = std::chrono::milliseconds(
        env_int("JITSTREAM_TUNNEL_INTERVAL_MS", static_cast<int>(config.tunnelInterval.count()), 0));
    config.detachCommands = env_int("JITSTREAM_DETACH_COMMANDS", config.detachCommands, 1);
    config.scanInterval = std::chrono::milliseconds(
        env_int("JITSTREAM_SCAN_INTERVAL_MS", static_cast<int>(config.scanInterval.count()), 10));
    return config;
}

bool Config::applyFlag(const std::string& flag, const std::string& value, std::string& error) {
    int number = 0;
    if (flag == "--db") {
        database = value;
    } else if (flag == "--pairing-dir") {
        pairingDir = value;
    } else if (flag == "--mux-socket") {
        muxSocket = value;
    } else if (flag == "--tunneld") {
        tunneldUrl = value;
    } else if (flag == "-w" || flag == "--workers") {
        if (!parse_int(value, 1, number)) {
            error = "Invalid worker count: " + value;
            return false;
        }
        workers = number;
    } else if (flag == "--detach-commands") {
        if (!parse_int(value, 1, number)) {
            error = "Invalid detach command count: " + value;
            return false;
        }
        detachCommands = number;
    } else if (flag == "--tunnel-attempts") {
        if (!parse_int(value, 1, number)) {
            error = "Invalid tunnel attempt count: " + value;
            return false;
        }
        tunnelAttempts = number;
    } else {
        error = "Unknown option: " + flag;
        return false;
    }
    return true;
}

}
