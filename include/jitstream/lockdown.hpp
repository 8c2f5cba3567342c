/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <string>
#include <vector>

#include <plist/plist.h>

#include "jitstream/heartbeat.hpp"
#include "jitstream/types.hpp"

namespace jitstream {

struct ProbeResult {
    bool ok = false;
    bool mounted = false;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Whether the device already has a developer disk image mounted.
class ImageProbe {
public:
    virtual ~ImageProbe() = default;
    [[nodiscard]] virtual ProbeResult developerImageMounted(const DeviceId& device) noexcept = 0;
};

struct AppListing {
    bool ok = false;
    std::vector<std::string> bundleIds;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Installed user apps a debugger may attach to.
class AppCatalog {
public:
    virtual ~AppCatalog() = default;
    [[nodiscard]] virtual AppListing debuggableApps(const DeviceId& device) noexcept = 0;
};

// Bundle ids of entries in an installation_proxy browse result whose
// Entitlements carry get-task-allow = true. Input order is preserved.
[[nodiscard]] std::vector<std::string> debuggableBundleIds(plist_t apps);

/*
 * Keep-alive over com.apple.mobile.heartbeat, reached through the
 * multiplexer once the device has been announced to it. The loop runs on a
 * detached thread that answers each "Marco" with a "Polo" and exits on the
 * first error or once its handle is cancelled.
 */
class LockdownHeartbeat final : public HeartbeatStarter {
public:
    explicit LockdownHeartbeat(std::string label) : label_(std::move(label)) {}

    [[nodiscard]] HeartbeatStart start(const DeviceId& device) noexcept override;

private:
    std::string label_;
};

class LockdownImageProbe final : public ImageProbe {
public:
    explicit LockdownImageProbe(std::string label) : label_(std::move(label)) {}

    [[nodiscard]] ProbeResult developerImageMounted(const DeviceId& device) noexcept override;

private:
    std::string label_;
};

class LockdownAppCatalog final : public AppCatalog {
public:
    explicit LockdownAppCatalog(std::string label) : label_(std::move(label)) {}

    [[nodiscard]] AppListing debuggableApps(const DeviceId& device) noexcept override;

private:
    std::string label_;
};

}
