/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/remote_services.hpp"

namespace jitstream {

DiscoveryResult TunnelRemoteServices::discover(const TunnelDescriptor& tunnel) noexcept {
    return discoverServices(tunnel.address, tunnel.port, timeout_);
}

LaunchResult TunnelRemoteServices::launch(const ServiceEndpoint& endpoint, const std::string& bundleId) noexcept {
    ProcessControlClient client(label_, timeout_);
    return client.launch(endpoint.address, endpoint.port, bundleId);
}

AttachResult TunnelRemoteServices::attach(const ServiceEndpoint& endpoint, Pid pid, int detachCommands) noexcept {
    DebugProxyClient client(timeout_);
    return client.attachAndDetach(endpoint.address, endpoint.port, pid, detachCommands);
}

}
