/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace jitstream {

enum class FailureKind : std::uint8_t {
    Backend,        // queue or record storage unavailable / bad statement
    Timeout,        // tunnel never appeared within the allowed lookups
    Protocol,       // a device-communication step failed
    NotMounted,     // required developer services absent
    NotRegistered,  // no device record for the source address
    Credential      // pairing record missing or unusable
};

// Pipeline position a failure is attributed to.
enum class Stage : std::uint8_t {
    Identity,
    QueueCheck,
    Registering,
    MountCheck,
    AwaitingTunnel,
    TunnelEstablished,
    ServiceDiscovery,
    ProcessLaunch,
    DebugAttach,
    AppListing,
    Done
};

struct Failure {
    FailureKind kind = FailureKind::Protocol;
    Stage stage = Stage::Identity;
    std::string detail;

    // Flattened, user-facing text. Only called at the response boundary.
    [[nodiscard]] std::string describe() const;

    static Failure backend(Stage stage, std::string detail) {
        return {FailureKind::Backend, stage, std::move(detail)};
    }
    static Failure protocol(Stage stage, std::string detail) {
        return {FailureKind::Protocol, stage, std::move(detail)};
    }
};

const char* stageName(Stage stage) noexcept;
const char* failureKindName(FailureKind kind) noexcept;

}
