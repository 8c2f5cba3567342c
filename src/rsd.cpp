/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/rsd.hpp"
#include "jitstream/logger.hpp"
#include <unordered_map>

namespace jitstream {

namespace {
constexpr const char* kPreface = "PRI * HTTP/2.0\r\n\r\nSM\r\n\r\n";
constexpr std::uint32_t kRootChannel = 1;
constexpr std::uint32_t kReplyChannel = 3;
constexpr std::uint32_t kMaxFrame = 1U << 20;
constexpr int kMaxFrames = 128;

// SETTINGS identifiers
constexpr std::uint16_t kMaxConcurrentStreams = 0x3;
constexpr std::uint16_t kInitialWindowSize = 0x4;

void append(Bytes& out, const Http2Frame& frame) {
    Bytes encoded = encodeHttp2Frame(frame);
    out.insert(out.end(), encoded.begin(), encoded.end());
}

Http2Frame dataFrame(std::uint32_t stream, const XpcMessage& message) {
    Http2Frame frame;
    frame.type = h2::Data;
    frame.stream = stream;
    frame.payload = encodeXpcMessage(message);
    return frame;
}

bool readFrame(Stream& stream, Http2Frame& frame, std::string& error) {
    Bytes header;
    if (!stream.recvExact(h2::HeaderSize, header)) {
        error = "read frame header: " + stream.error();
        return false;
    }
    std::uint32_t length = decodeHttp2Header(header.data(), frame);
    if (length > kMaxFrame) {
        error = "oversized frame (" + std::to_string(length) + " bytes)";
        return false;
    }
    frame.payload.clear();
    if (length > 0 && !stream.recvExact(length, frame.payload)) {
        error = "read frame payload: " + stream.error();
        return false;
    }
    return true;
}
}

Bytes encodeHttp2Frame(const Http2Frame& frame) {
    Bytes out;
    out.reserve(h2::HeaderSize + frame.payload.size());
    std::uint32_t length = static_cast<std::uint32_t>(frame.payload.size());
    out.push_back(static_cast<std::uint8_t>(length >> 16));
    out.push_back(static_cast<std::uint8_t>(length >> 8));
    out.push_back(static_cast<std::uint8_t>(length));
    out.push_back(frame.type);
    out.push_back(frame.flags);
    putU32(out, frame.stream & 0x7fffffffU);
    out.insert(out.end(), frame.payload.begin(), frame.payload.end());
    return out;
}

std::uint32_t decodeHttp2Header(const std::uint8_t* header, Http2Frame& frame) noexcept {
    std::uint32_t length = (std::uint32_t(header[0]) << 16) | (std::uint32_t(header[1]) << 8) | header[2];
    frame.type = header[3];
    frame.flags = header[4];
    frame.stream = readU32(header + 5) & 0x7fffffffU;
    return length;
}

std::optional<std::uint16_t> ServiceTable::port(const std::string& name) const {
    auto it = ports.find(name);
    if (it == ports.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool parseServiceTable(const XpcValue& handshake, ServiceTable& out, std::string& error) {
    const XpcValue* services = handshake.find("Services");
    if (!services || services->type() != XpcType::Dictionary) {
        error = "handshake carried no service table";
        return false;
    }

    for (std::size_t i = 0; i < services->size(); ++i) {
        const XpcValue* port = services->values()[i].find("Port");
        if (!port) {
            continue;
        }
        std::uint64_t number = 0;
        if (auto text = port->asString()) {
            try {
                number = std::stoul(*text);
            } catch (const std::exception&) {
                continue;
            }
        } else if (auto value = port->asUint64()) {
            number = *value;
        }
        if (number == 0 || number > 65535) {
            continue;
        }
        out.ports[services->keys()[i]] = static_cast<std::uint16_t>(number);
    }

    if (const XpcValue* properties = handshake.find("Properties")) {
        if (const XpcValue* udid = properties->find("UniqueDeviceID")) {
            out.deviceId = udid->asString().value_or("");
        }
    }
    return true;
}

Bytes buildRsdHandshake() {
    Bytes out(kPreface, kPreface + 24);

    Http2Frame settings;
    settings.type = h2::Settings;
    putU16(settings.payload, kMaxConcurrentStreams);
    putU32(settings.payload, 100);
    putU16(settings.payload, kInitialWindowSize);
    putU32(settings.payload, 1048576);
    append(out, settings);

    Http2Frame window;
    window.type = h2::WindowUpdate;
    putU32(window.payload, 983041);
    append(out, window);

    Http2Frame rootHeaders;
    rootHeaders.type = h2::Headers;
    rootHeaders.flags = h2::FlagEndHeaders;
    rootHeaders.stream = kRootChannel;
    append(out, rootHeaders);

    XpcMessage hello;
    hello.flags = xpc_flags::AlwaysSet;
    hello.body = XpcValue::dictionary();
    append(out, dataFrame(kRootChannel, hello));

    XpcMessage open;
    open.flags = 0x0201;
    append(out, dataFrame(kRootChannel, open));

    Http2Frame replyHeaders;
    replyHeaders.type = h2::Headers;
    replyHeaders.flags = h2::FlagEndHeaders;
    replyHeaders.stream = kReplyChannel;
    append(out, replyHeaders);

    XpcMessage init;
    init.flags = xpc_flags::AlwaysSet | xpc_flags::InitHandshake;
    append(out, dataFrame(kReplyChannel, init));
    return out;
}

DiscoveryResult discoverServices(const std::string& address, std::uint16_t port,
                                 std::chrono::milliseconds timeout) noexcept {
    DiscoveryResult result;
    try {
        Stream stream;
        stream.setTimeout(timeout);
        if (!stream.connectTcp(address, port)) {
            result.error = "service discovery connect failed: " + stream.error();
            return result;
        }
        if (!stream.sendAll(buildRsdHandshake())) {
            result.error = "service discovery write failed: " + stream.error();
            return result;
        }

        std::unordered_map<std::uint32_t, Bytes> pending;
        for (int count = 0; count < kMaxFrames; ++count) {
            Http2Frame frame;
            if (!readFrame(stream, frame, result.error)) {
                return result;
            }

            switch (frame.type) {
                case h2::Settings:
                    if (!(frame.flags & h2::FlagAck)) {
                        Http2Frame ack;
                        ack.type = h2::Settings;
                        ack.flags = h2::FlagAck;
                        if (!stream.sendAll(encodeHttp2Frame(ack))) {
                            result.error = "settings ack failed: " + stream.error();
                            return result;
                        }
                    }
                    continue;
                case h2::Ping:
                    if (!(frame.flags & h2::FlagAck)) {
                        frame.flags = h2::FlagAck;
                        if (!stream.sendAll(encodeHttp2Frame(frame))) {
                            result.error = "ping ack failed: " + stream.error();
                            return result;
                        }
                    }
                    continue;
                case h2::GoAway:
                    result.error = "device closed the service discovery session";
                    return result;
                case h2::Data:
                    break;
                default:
                    continue;
            }

            Bytes& buffer = pending[frame.stream];
            buffer.insert(buffer.end(), frame.payload.begin(), frame.payload.end());

            while (!buffer.empty()) {
                XpcMessage message;
                std::size_t consumed = 0;
                XpcDecode state = decodeXpcMessage(buffer.data(), buffer.size(), message, consumed);
                if (state == XpcDecode::NeedMore) {
                    break;
                }
                if (state == XpcDecode::Invalid) {
                    result.error = "malformed XPC message on stream " + std::to_string(frame.stream);
                    return result;
                }
                buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(consumed));

                if (!message.body || !message.body->find("Services")) {
                    continue;
                }
                if (!parseServiceTable(*message.body, result.services, result.error)) {
                    return result;
                }
                LOG_DEBUG("Service discovery on [" + address + "]:" + std::to_string(port) + " listed " +
                          std::to_string(result.services.ports.size()) + " services");
                result.ok = true;
                return result;
            }
        }
        result.error = "no service table after " + std::to_string(kMaxFrames) + " frames";
        return result;
    } catch (const std::exception& e) {
        result.ok = false;
        result.error = std::string("service discovery failed: ") + e.what();
        return result;
    }
}

}
