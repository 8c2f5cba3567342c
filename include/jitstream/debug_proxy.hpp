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

#include "jitstream/net.hpp"
#include "jitstream/types.hpp"

namespace jitstream {

// GDB remote serial protocol, as spoken by the device's debugserver proxy.
[[nodiscard]] std::uint8_t rspChecksum(const std::string& payload) noexcept;
// "$<payload>#<two hex digits>"
[[nodiscard]] std::string encodeRspPacket(const std::string& payload);

/*
 * Pulls one packet off the front of buffer. Leading '+' / '-' acks are
 * skipped. Returns the payload and erases the consumed bytes; empty when the
 * buffer does not yet hold a full packet. A checksum mismatch sets bad.
 */
[[nodiscard]] std::optional<std::string> takeRspPacket(std::string& buffer, bool& bad);

// "E.." replies are failures; everything else, including "OK" and empty, is not.
[[nodiscard]] inline bool isRspError(const std::string& reply) noexcept {
    return reply.size() == 3 && reply[0] == 'E';
}

struct AttachResult {
    bool ok = false;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

class DebugProxyClient final {
public:
    explicit DebugProxyClient(std::chrono::milliseconds timeout) : timeout_(timeout) {}

    DebugProxyClient(const DebugProxyClient&) = delete;
    DebugProxyClient& operator=(const DebugProxyClient&) = delete;

    // Attach to pid, then detach detachCommands times. Only the first detach
    // must be acknowledged; later replies are logged.
    [[nodiscard]] AttachResult attachAndDetach(const std::string& address, std::uint16_t port, Pid pid,
                                               int detachCommands) noexcept;

private:
    std::chrono::milliseconds timeout_;
    Stream stream_;
    std::string buffer_;

    [[nodiscard]] bool command(const std::string& payload, std::string& reply, std::string& error);
};

}
