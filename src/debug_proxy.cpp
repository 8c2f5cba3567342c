/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/debug_proxy.hpp"
#include "jitstream/logger.hpp"
#include <cstdio>

namespace jitstream {

namespace {
constexpr std::size_t kMaxReply = 1U << 16;

int hexValue(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string toHex(Pid pid) {
    char text[32];
    std::snprintf(text, sizeof(text), "%llx", static_cast<unsigned long long>(pid));
    return text;
}
}

std::uint8_t rspChecksum(const std::string& payload) noexcept {
    unsigned sum = 0;
    for (unsigned char c : payload) {
        sum += c;
    }
    return static_cast<std::uint8_t>(sum & 0xff);
}

std::string encodeRspPacket(const std::string& payload) {
    char digits[3];
    std::snprintf(digits, sizeof(digits), "%02x", rspChecksum(payload));
    return "$" + payload + "#" + digits;
}

std::optional<std::string> takeRspPacket(std::string& buffer, bool& bad) {
    bad = false;
    std::size_t start = 0;
    while (start < buffer.size() && (buffer[start] == '+' || buffer[start] == '-')) {
        ++start;
    }
    if (start == buffer.size()) {
        buffer.clear();
        return std::nullopt;
    }
    if (buffer[start] != '$') {
        bad = true;
        return std::nullopt;
    }
    std::size_t hash = buffer.find('#', start + 1);
    if (hash == std::string::npos || hash + 2 >= buffer.size()) {
        buffer.erase(0, start);
        return std::nullopt;
    }

    std::string payload = buffer.substr(start + 1, hash - start - 1);
    int high = hexValue(buffer[hash + 1]);
    int low = hexValue(buffer[hash + 2]);
    buffer.erase(0, hash + 3);
    if (high < 0 || low < 0 || static_cast<std::uint8_t>(high * 16 + low) != rspChecksum(payload)) {
        bad = true;
        return std::nullopt;
    }
    return payload;
}

AttachResult DebugProxyClient::attachAndDetach(const std::string& address, std::uint16_t port, Pid pid,
                                               int detachCommands) noexcept {
    AttachResult result;
    try {
        stream_.setTimeout(timeout_);
        if (!stream_.connectTcp(address, port)) {
            result.error = "debug proxy connect failed: " + stream_.error();
            return result;
        }

        std::string reply;
        if (!command("QStartNoAckMode", reply, result.error)) {
            return result;
        }
        // Reply ignored: older proxies answer with an empty packet.
        if (!command("QSetDetachOnError:1", reply, result.error)) {
            return result;
        }

        if (!command("vAttach;" + toHex(pid), reply, result.error)) {
            return result;
        }
        if (isRspError(reply)) {
            result.error = "attach to pid " + std::to_string(pid) + " refused (" + reply + ")";
            return result;
        }
        LOG_DEBUG("Attached to pid " + std::to_string(pid) + ": " + reply.substr(0, 16));

        for (int i = 0; i < detachCommands; ++i) {
            std::string error;
            if (!command("D", reply, error) || isRspError(reply)) {
                if (i == 0) {
                    result.error = "detach from pid " + std::to_string(pid) + " failed" +
                                   (error.empty() ? " (" + reply + ")" : ": " + error);
                    return result;
                }
                LOG_DEBUG("Extra detach #" + std::to_string(i + 1) + " answered " +
                          (error.empty() ? reply : error));
                break;
            }
        }
        stream_.close();
        result.ok = true;
        return result;
    } catch (const std::exception& e) {
        stream_.close();
        result.error = std::string("debug proxy failed: ") + e.what();
        return result;
    }
}

bool DebugProxyClient::command(const std::string& payload, std::string& reply, std::string& error) {
    if (!stream_.sendAll(encodeRspPacket(payload))) {
        error = "debug proxy write (" + payload + ") failed: " + stream_.error();
        return false;
    }
    while (true) {
        bool bad = false;
        if (auto packet = takeRspPacket(buffer_, bad)) {
            reply = *packet;
            return true;
        }
        if (bad) {
            error = "malformed reply to " + payload;
            return false;
        }
        if (buffer_.size() > kMaxReply) {
            error = "oversized reply to " + payload;
            return false;
        }
        Bytes chunk;
        if (!stream_.recvSome(4096, chunk)) {
            error = "debug proxy read (" + payload + ") failed: " + stream_.error();
            return false;
        }
        buffer_.append(chunk.begin(), chunk.end());
    }
}

}
