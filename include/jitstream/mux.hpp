/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include "jitstream/net.hpp"
#include "jitstream/types.hpp"

namespace jitstream {

// usbmuxd control framing: 16 bytes little-endian, then an XML plist.
struct MuxHeader {
    std::uint32_t length = 0;   // whole packet, header included
    std::uint32_t version = 1;
    std::uint32_t message = 8;  // plist
    std::uint32_t tag = 0;
};

constexpr std::size_t kMuxHeaderSize = 16;
constexpr const char* kMuxServiceName = "_apple-mobdev2._tcp.local";

enum class MuxRequest : std::uint8_t { AddDevice, RemoveDevice };

[[nodiscard]] Bytes encodeMuxPacket(const std::string& payload, std::uint32_t tag);
[[nodiscard]] std::optional<MuxHeader> decodeMuxHeader(const Bytes& data) noexcept;

// XML request body for AddDevice / RemoveDevice.
[[nodiscard]] std::string buildMuxRequest(MuxRequest request, const DeviceId& device,
                                          const std::string& address);

// SavePairRecord body carrying the raw record for device.
[[nodiscard]] std::string buildPairRecordRequest(const DeviceId& device, const Bytes& record);

// Result field of a response body; empty when absent or unparsable.
[[nodiscard]] std::optional<std::uint64_t> parseMuxResult(const Bytes& payload) noexcept;

struct RegisterResult {
    bool ok = false;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

class MuxRegistrar {
public:
    virtual ~MuxRegistrar() = default;
    [[nodiscard]] virtual RegisterResult addDevice(const DeviceId& device, const std::string& address) noexcept = 0;
    [[nodiscard]] virtual RegisterResult removeDevice(const DeviceId& device) noexcept = 0;
    // Makes the host's pairing record available to lockdown clients of the multiplexer.
    [[nodiscard]] virtual RegisterResult savePairRecord(const DeviceId& device, const Bytes& record) noexcept = 0;
};

// Talks to a network-capable multiplexer (netmuxd) over its unix socket.
class UsbmuxRegistrar final : public MuxRegistrar {
public:
    explicit UsbmuxRegistrar(std::string socketPath) : socketPath_(std::move(socketPath)) {}

    [[nodiscard]] RegisterResult addDevice(const DeviceId& device, const std::string& address) noexcept override;
    [[nodiscard]] RegisterResult removeDevice(const DeviceId& device) noexcept override;
    [[nodiscard]] RegisterResult savePairRecord(const DeviceId& device, const Bytes& record) noexcept override;

private:
    std::string socketPath_;
    std::atomic<std::uint32_t> nextTag_{1};

    // Sends body and expects Result == accepted.
    [[nodiscard]] RegisterResult exchange(const char* name, const DeviceId& device, const std::string& body,
                                          std::uint64_t accepted) noexcept;
};

}
