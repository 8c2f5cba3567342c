/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include "jitstream/debug_proxy.hpp"
#include "jitstream/dtx.hpp"
#include "jitstream/rsd.hpp"
#include "jitstream/types.hpp"

namespace jitstream {

constexpr const char* kProcessControlService = "com.apple.instruments.dtservicehub";
constexpr const char* kDebugProxyService = "com.apple.internal.dt.remote.debugproxy";

// A service reachable on the tunnel.
struct ServiceEndpoint {
    std::string address;
    std::uint16_t port = 0;
};

// Device-side steps of a session, behind one seam so sessions can run on fakes.
class RemoteServices {
public:
    virtual ~RemoteServices() = default;

    [[nodiscard]] virtual DiscoveryResult discover(const TunnelDescriptor& tunnel) noexcept = 0;
    [[nodiscard]] virtual LaunchResult launch(const ServiceEndpoint& endpoint, const std::string& bundleId) noexcept = 0;
    [[nodiscard]] virtual AttachResult attach(const ServiceEndpoint& endpoint, Pid pid,
                                              int detachCommands) noexcept = 0;
};

class TunnelRemoteServices final : public RemoteServices {
public:
    TunnelRemoteServices(std::string label, std::chrono::milliseconds timeout)
        : label_(std::move(label)), timeout_(timeout) {}

    [[nodiscard]] DiscoveryResult discover(const TunnelDescriptor& tunnel) noexcept override;
    [[nodiscard]] LaunchResult launch(const ServiceEndpoint& endpoint, const std::string& bundleId) noexcept override;
    [[nodiscard]] AttachResult attach(const ServiceEndpoint& endpoint, Pid pid, int detachCommands) noexcept override;

private:
    std::string label_;
    std::chrono::milliseconds timeout_;
};

}
