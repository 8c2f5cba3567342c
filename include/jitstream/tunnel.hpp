/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "jitstream/types.hpp"

namespace jitstream {

// Source of tunnel descriptors, keyed by device.
class TunnelDirectory {
public:
    virtual ~TunnelDirectory() = default;
    // Empty when the device has no tunnel yet or the directory is unreachable.
    [[nodiscard]] virtual std::optional<TunnelDescriptor> lookup(const DeviceId& device) noexcept = 0;
};

/*
 * Parses the tunnel daemon's listing:
 *   { "<udid>": [ { "tunnel-address": "...", "tunnel-port": 1234, "interface": "utun3" } ] }
 * Entries missing an address or port are skipped.
 */
[[nodiscard]] bool parseTunneldListing(const std::string& body, std::vector<TunnelDescriptor>& out,
                                       std::string& error);

// Queries a pymobiledevice3-style tunneld over HTTP.
class TunneldDirectory final : public TunnelDirectory {
public:
    explicit TunneldDirectory(std::string url);
    ~TunneldDirectory() override;

    TunneldDirectory(const TunneldDirectory&) = delete;
    TunneldDirectory& operator=(const TunneldDirectory&) = delete;

    [[nodiscard]] std::optional<TunnelDescriptor> lookup(const DeviceId& device) noexcept override;

    // Whole listing; false when the daemon could not be queried.
    [[nodiscard]] bool list(std::vector<TunnelDescriptor>& out, std::string& error) noexcept;

private:
    std::string url_;
    std::chrono::milliseconds timeout_{2000};
};

// Polls the directory until the device shows up. The sleeper runs between
// lookups only, so `attempts` lookups cost attempts-1 waits.
[[nodiscard]] std::optional<TunnelDescriptor> waitForTunnel(TunnelDirectory& directory, const DeviceId& device,
                                                            int attempts, std::chrono::milliseconds interval,
                                                            const Sleeper& sleep);

}
