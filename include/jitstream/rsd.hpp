/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "jitstream/net.hpp"
#include "jitstream/types.hpp"
#include "jitstream/xpc.hpp"

namespace jitstream {

// Minimal HTTP/2 framing, enough to carry XPC over the tunnel.
namespace h2 {
constexpr std::uint8_t Data = 0x0;
constexpr std::uint8_t Headers = 0x1;
constexpr std::uint8_t RstStream = 0x3;
constexpr std::uint8_t Settings = 0x4;
constexpr std::uint8_t Ping = 0x6;
constexpr std::uint8_t GoAway = 0x7;
constexpr std::uint8_t WindowUpdate = 0x8;

constexpr std::uint8_t FlagEndStream = 0x1;
constexpr std::uint8_t FlagAck = 0x1;
constexpr std::uint8_t FlagEndHeaders = 0x4;

constexpr std::size_t HeaderSize = 9;
}

struct Http2Frame {
    std::uint8_t type = h2::Data;
    std::uint8_t flags = 0;
    std::uint32_t stream = 0;
    Bytes payload;
};

[[nodiscard]] Bytes encodeHttp2Frame(const Http2Frame& frame);
// Fills everything but the payload; returns the payload length.
[[nodiscard]] std::uint32_t decodeHttp2Header(const std::uint8_t* header, Http2Frame& frame) noexcept;

// Service name -> port, as advertised by the device's service discovery.
struct ServiceTable {
    DeviceId deviceId;
    std::map<std::string, std::uint16_t> ports;

    [[nodiscard]] std::optional<std::uint16_t> port(const std::string& name) const;
};

// Reads "Services" -> {name: {"Port": "NNNN"}} and Properties.UniqueDeviceID.
[[nodiscard]] bool parseServiceTable(const XpcValue& handshake, ServiceTable& out, std::string& error);

// Client frames of the handshake, in send order. Exposed for tests.
[[nodiscard]] Bytes buildRsdHandshake();

struct DiscoveryResult {
    bool ok = false;
    ServiceTable services;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

[[nodiscard]] DiscoveryResult discoverServices(const std::string& address, std::uint16_t port,
                                               std::chrono::milliseconds timeout) noexcept;

}
