/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/failure.hpp"

namespace jitstream {

const char* stageName(Stage stage) noexcept {
    switch (stage) {
        case Stage::Identity: return "identity";
        case Stage::QueueCheck: return "queue check";
        case Stage::Registering: return "registering";
        case Stage::MountCheck: return "mount check";
        case Stage::AwaitingTunnel: return "awaiting tunnel";
        case Stage::TunnelEstablished: return "tunnel established";
        case Stage::ServiceDiscovery: return "service discovery";
        case Stage::ProcessLaunch: return "process launch";
        case Stage::DebugAttach: return "debug attach";
        case Stage::AppListing: return "app listing";
        case Stage::Done: return "done";
        default: return "unknown";
    }
}

const char* failureKindName(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::Backend: return "backend";
        case FailureKind::Timeout: return "timeout";
        case FailureKind::Protocol: return "protocol";
        case FailureKind::NotMounted: return "not mounted";
        case FailureKind::NotRegistered: return "not registered";
        case FailureKind::Credential: return "credential";
        default: return "unknown";
    }
}

std::string Failure::describe() const {
    switch (kind) {
        case FailureKind::Backend:
            return "Server storage error during " + std::string(stageName(stage)) +
                   (detail.empty() ? "" : ": " + detail);
        case FailureKind::Timeout:
            return "Device not reachable within timeout: the tunnel never came up" +
                   (detail.empty() ? std::string() : " (" + detail + ")");
        case FailureKind::NotMounted:
            return "Developer disk image not mounted" +
                   (detail.empty() ? std::string() : ": " + detail);
        case FailureKind::NotRegistered:
            return "No device registered for this address" +
                   (detail.empty() ? std::string() : " (" + detail + ")");
        case FailureKind::Credential:
            return "Pairing record unusable" + (detail.empty() ? std::string() : ": " + detail);
        case FailureKind::Protocol:
        default:
            return "Device communication failed during " + std::string(stageName(stage)) +
                   (detail.empty() ? "" : ": " + detail);
    }
}

}
