/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "jitstream/net.hpp"
#include "jitstream/plist.hpp"
#include "jitstream/types.hpp"

namespace jitstream {

constexpr std::uint32_t kDtxMagic = 0x1F3D5B79;
constexpr std::size_t kDtxHeaderSize = 32;
constexpr std::size_t kDtxPayloadHeaderSize = 16;

// Fixed 32-byte message header.
struct DtxHeader {
    std::uint16_t fragmentId = 0;
    std::uint16_t fragmentCount = 1;
    std::uint32_t length = 0;            // bytes following this header
    std::uint32_t identifier = 0;
    std::uint32_t conversationIndex = 0;
    std::uint32_t channel = 0;
    bool expectsReply = false;
};

// Argument list carried beside the selector.
class DtxAux {
public:
    DtxAux& appendObject(const Bytes& archived);
    DtxAux& appendU32(std::uint32_t value);
    DtxAux& appendU64(std::uint64_t value);

    [[nodiscard]] Bytes encode() const;
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    Bytes entries_;
};

struct DtxMessage {
    std::uint32_t identifier = 0;
    std::uint32_t conversationIndex = 0;
    std::uint32_t channel = 0;
    bool expectsReply = false;
    std::uint32_t payloadType = 2;
    Bytes aux;       // encoded DtxAux
    Bytes payload;   // archived selector or return value
};

[[nodiscard]] Bytes encodeDtxMessage(const DtxMessage& message);
[[nodiscard]] std::optional<DtxHeader> decodeDtxHeader(const std::uint8_t* data) noexcept;
// Splits a reassembled body (payload header, aux, payload).
[[nodiscard]] bool decodeDtxBody(const Bytes& body, DtxMessage& out) noexcept;

struct LaunchResult {
    bool ok = false;
    Pid pid = 0;
    bool memoryLimitLifted = false;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

/*
 * Instruments process control reached through a service-discovery port:
 * RSD check-in, DTX capability exchange, channel open, then
 * launchSuspendedProcessWithDevicePath:... and the memory-limit request.
 */
class ProcessControlClient final {
public:
    ProcessControlClient(std::string label, std::chrono::milliseconds timeout)
        : label_(std::move(label)), timeout_(timeout) {}

    ProcessControlClient(const ProcessControlClient&) = delete;
    ProcessControlClient& operator=(const ProcessControlClient&) = delete;

    [[nodiscard]] LaunchResult launch(const std::string& address, std::uint16_t port,
                                      const std::string& bundleId) noexcept;

private:
    std::string label_;
    std::chrono::milliseconds timeout_;
    Stream stream_;
    std::uint32_t nextIdentifier_ = 1;

    [[nodiscard]] bool checkIn(std::string& error);
    [[nodiscard]] bool exchangeCapabilities(std::string& error);
    [[nodiscard]] bool openChannel(std::uint32_t code, const std::string& service, std::string& error);
    [[nodiscard]] bool send(std::uint32_t channel, const std::string& selector, const DtxAux& aux,
                            bool expectsReply, std::uint32_t& identifier, std::string& error);
    [[nodiscard]] bool receive(DtxMessage& out, std::string& error);
    [[nodiscard]] bool awaitReply(std::uint32_t identifier, DtxMessage& out, std::string& error);
};

}
