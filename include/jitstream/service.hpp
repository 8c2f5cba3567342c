/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "jitstream/session.hpp"
#include "jitstream/types.hpp"

namespace jitstream {

struct LaunchResponse {
    bool ok = false;
    bool mountingRequired = false;
    std::size_t position = 0;   // in whichever queue the request now waits in
    Pid pid = 0;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct AppsResponse {
    bool ok = false;
    std::vector<std::string> bundleIds;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct StatusReport {
    QueueStatus mount;
    QueueStatus launch;
    std::string message;
};

/*
 * Request facade. Every entry point resolves the caller's address to a
 * device first, then consults the mount queue; a device waiting on a disk
 * image never reaches the device protocols.
 */
class JitService final {
public:
    explicit JitService(SessionContext& context) noexcept : context_(context) {}

    JitService(const JitService&) = delete;
    JitService& operator=(const JitService&) = delete;

    // Runs the whole session on the calling thread.
    [[nodiscard]] LaunchResponse launchApp(const std::string& sourceAddress, const std::string& bundleId) noexcept;

    // Leaves the session to the daemon's workers.
    [[nodiscard]] LaunchResponse enqueueLaunch(const std::string& sourceAddress, const std::string& bundleId) noexcept;

    // Worker side: run a claimed launch entry and record the outcome. The
    // entry's address must still resolve to the entry's device.
    [[nodiscard]] LaunchResponse processClaimed(const QueueEntry& entry) noexcept;

    // Installed apps carrying get-task-allow. Refused while the device waits
    // in either queue.
    [[nodiscard]] AppsResponse listApps(const std::string& sourceAddress) noexcept;

    [[nodiscard]] StatusReport status(const std::string& sourceAddress) noexcept;

    // Drops the device from the multiplexer and stops its keep-alive.
    [[nodiscard]] LaunchResponse release(const std::string& sourceAddress) noexcept;

private:
    SessionContext& context_;

    [[nodiscard]] std::optional<LaunchResponse> mountGate(const DeviceId& device);
    [[nodiscard]] LaunchResponse runSession(const Identity& identity, const std::string& address,
                                            const std::string& bundleId);
};

}
