/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <string>

namespace jitstream {

struct Config {
    std::filesystem::path database = "jitstream.db";
    std::filesystem::path pairingDir = "/var/lib/lockdown";
    std::string muxSocket = "/var/run/usbmuxd";
    std::string tunneldUrl = "http://127.0.0.1:49151/";
    std::string label = "jitstream";

    int workers = 4;
    int tunnelAttempts = 100;
    std::chrono::milliseconds tunnelInterval{100};
    int detachCommands = 2;
    std::chrono::milliseconds scanInterval{1000};

    // Environment first (JITSTREAM_*), defaults for anything unset or invalid.
    [[nodiscard]] static Config fromEnv();

    // Consumes "--key value" pairs it recognises; returns false on a bad value.
    [[nodiscard]] bool applyFlag(const std::string& flag, const std::string& value, std::string& error);
};

}
