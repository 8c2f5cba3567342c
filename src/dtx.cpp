/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/dtx.hpp"
#include "jitstream/archiver.hpp"
#include "jitstream/logger.hpp"

namespace jitstream {

namespace {
constexpr std::uint64_t kAuxMagic = 0x1f0;
constexpr std::uint32_t kAuxEntry = 0x0a;
constexpr std::uint32_t kAuxObject = 2;
constexpr std::uint32_t kAuxU32 = 3;
constexpr std::uint32_t kAuxU64 = 4;
constexpr std::uint32_t kExpectsReplyFlag = 0x1000;
constexpr std::uint32_t kMaxBody = 16U << 20;
constexpr std::uint32_t kMaxPlist = 1U << 20;
constexpr int kMaxUnrelated = 64;

constexpr const char* kProcessControl = "com.apple.instruments.server.services.processcontrol";
constexpr std::uint32_t kProcessControlChannel = 1;

std::string selectorOf(const DtxMessage& message) {
    if (message.payload.empty()) {
        return "";
    }
    bool ok = false;
    PlistPtr value = unarchive(message.payload, ok);
    if (!ok || !value || plist_get_node_type(static_cast<plist_t>(value.get())) != PLIST_STRING) {
        return "";
    }
    char* text = nullptr;
    plist_get_string_val(static_cast<plist_t>(value.get()), &text);
    std::string out = text ? text : "";
    plist_mem_free(text);
    return out;
}

bool sendPlist(Stream& stream, plist_t node, std::string& error) {
    std::string xml = toXml(node);
    if (xml.empty()) {
        error = "failed to serialise check-in request";
        return false;
    }
    Bytes frame;
    putU32(frame, static_cast<std::uint32_t>(xml.size()));
    frame.insert(frame.end(), xml.begin(), xml.end());
    if (!stream.sendAll(frame)) {
        error = "check-in write failed: " + stream.error();
        return false;
    }
    return true;
}

PlistPtr receivePlist(Stream& stream, std::string& error) {
    Bytes head;
    if (!stream.recvExact(4, head)) {
        error = "check-in read failed: " + stream.error();
        return nullptr;
    }
    std::uint32_t length = readU32(head.data());
    if (length == 0 || length > kMaxPlist) {
        error = "bad check-in frame length " + std::to_string(length);
        return nullptr;
    }
    Bytes body;
    if (!stream.recvExact(length, body)) {
        error = "check-in read failed: " + stream.error();
        return nullptr;
    }
    PlistPtr node = parsePlist(body);
    if (!node) {
        error = "check-in response is not a plist";
    }
    return node;
}

bool expectRequest(Stream& stream, const char* request, std::string& error) {
    PlistPtr reply = receivePlist(stream, error);
    if (!reply) {
        return false;
    }
    auto value = dictString(static_cast<plist_t>(reply.get()), "Request");
    if (!value || *value != request) {
        auto detail = dictString(static_cast<plist_t>(reply.get()), "Error");
        error = std::string("check-in expected ") + request + ", got " + value.value_or("nothing") +
                (detail ? " (" + *detail + ")" : "");
        return false;
    }
    return true;
}
}

DtxAux& DtxAux::appendObject(const Bytes& archived) {
    putU32le(entries_, kAuxEntry);
    putU32le(entries_, kAuxObject);
    putU32le(entries_, static_cast<std::uint32_t>(archived.size()));
    entries_.insert(entries_.end(), archived.begin(), archived.end());
    return *this;
}

DtxAux& DtxAux::appendU32(std::uint32_t value) {
    putU32le(entries_, kAuxEntry);
    putU32le(entries_, kAuxU32);
    putU32le(entries_, value);
    return *this;
}

DtxAux& DtxAux::appendU64(std::uint64_t value) {
    putU32le(entries_, kAuxEntry);
    putU32le(entries_, kAuxU64);
    putU64le(entries_, value);
    return *this;
}

Bytes DtxAux::encode() const {
    if (entries_.empty()) {
        return {};
    }
    Bytes out;
    out.reserve(16 + entries_.size());
    putU64le(out, kAuxMagic);
    putU64le(out, entries_.size());
    out.insert(out.end(), entries_.begin(), entries_.end());
    return out;
}

Bytes encodeDtxMessage(const DtxMessage& message) {
    std::uint64_t total = message.aux.size() + message.payload.size();

    Bytes out;
    out.reserve(kDtxHeaderSize + kDtxPayloadHeaderSize + total);
    putU32le(out, kDtxMagic);
    putU32le(out, static_cast<std::uint32_t>(kDtxHeaderSize));
    out.push_back(0);   // fragment 0
    out.push_back(0);
    out.push_back(1);   // of 1
    out.push_back(0);
    putU32le(out, static_cast<std::uint32_t>(kDtxPayloadHeaderSize + total));
    putU32le(out, message.identifier);
    putU32le(out, message.conversationIndex);
    putU32le(out, message.channel);
    putU32le(out, message.expectsReply ? 1 : 0);

    putU32le(out, message.payloadType | (message.expectsReply ? kExpectsReplyFlag : 0));
    putU32le(out, static_cast<std::uint32_t>(message.aux.size()));
    putU64le(out, total);
    out.insert(out.end(), message.aux.begin(), message.aux.end());
    out.insert(out.end(), message.payload.begin(), message.payload.end());
    return out;
}

std::optional<DtxHeader> decodeDtxHeader(const std::uint8_t* data) noexcept {
    if (readU32le(data) != kDtxMagic || readU32le(data + 4) != kDtxHeaderSize) {
        return std::nullopt;
    }
    DtxHeader header;
    header.fragmentId = readU16le(data + 8);
    header.fragmentCount = readU16le(data + 10);
    header.length = readU32le(data + 12);
    header.identifier = readU32le(data + 16);
    header.conversationIndex = readU32le(data + 20);
    header.channel = readU32le(data + 24);
    header.expectsReply = readU32le(data + 28) != 0;
    if (header.fragmentCount == 0 || header.fragmentId >= header.fragmentCount) {
        return std::nullopt;
    }
    return header;
}

bool decodeDtxBody(const Bytes& body, DtxMessage& out) noexcept {
    if (body.size() < kDtxPayloadHeaderSize) {
        return false;
    }
    std::uint32_t flags = readU32le(body.data());
    std::uint32_t auxLength = readU32le(body.data() + 4);
    std::uint64_t total = readU64le(body.data() + 8);
    if (total > body.size() - kDtxPayloadHeaderSize || auxLength > total) {
        return false;
    }
    try {
        out.payloadType = flags & 0xff;
        auto begin = body.begin() + static_cast<std::ptrdiff_t>(kDtxPayloadHeaderSize);
        out.aux.assign(begin, begin + auxLength);
        out.payload.assign(begin + auxLength, begin + static_cast<std::ptrdiff_t>(total));
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

LaunchResult ProcessControlClient::launch(const std::string& address, std::uint16_t port,
                                          const std::string& bundleId) noexcept {
    LaunchResult result;
    try {
        stream_.setTimeout(timeout_);
        if (!stream_.connectTcp(address, port)) {
            result.error = "process control connect failed: " + stream_.error();
            return result;
        }
        if (!checkIn(result.error) || !exchangeCapabilities(result.error) ||
            !openChannel(kProcessControlChannel, kProcessControl, result.error)) {
            return result;
        }

        PlistPtr environment = adopt(plist_new_dict());
        PlistPtr arguments = adopt(plist_new_array());
        PlistPtr options = adopt(plist_new_dict());
        plist_dict_set_item(static_cast<plist_t>(options.get()), "StartSuspendedKey", plist_new_bool(1));
        plist_dict_set_item(static_cast<plist_t>(options.get()), "KillExisting", plist_new_bool(0));

        DtxAux launchArgs;
        launchArgs.appendObject(archiveString("/private/"))
            .appendObject(archiveString(bundleId))
            .appendObject(archive(static_cast<plist_t>(environment.get())))
            .appendObject(archive(static_cast<plist_t>(arguments.get())))
            .appendObject(archive(static_cast<plist_t>(options.get())));

        std::uint32_t identifier = 0;
        DtxMessage reply;
        if (!send(kProcessControlChannel,
                  "launchSuspendedProcessWithDevicePath:bundleIdentifier:environment:arguments:options:",
                  launchArgs, true, identifier, result.error) ||
            !awaitReply(identifier, reply, result.error)) {
            return result;
        }

        bool ok = false;
        PlistPtr value = unarchive(reply.payload, ok);
        plist_t node = static_cast<plist_t>(value.get());
        if (!ok || !node || plist_get_node_type(node) != PLIST_UINT) {
            auto reason = ok ? findStringValue(node, "NSLocalizedDescription") : std::nullopt;
            result.error = "launch of " + bundleId + " refused" + (reason ? ": " + *reason : "");
            return result;
        }
        std::uint64_t pid = 0;
        plist_get_uint_val(node, &pid);
        if (pid == 0) {
            result.error = "launch of " + bundleId + " returned no process";
            return result;
        }
        result.pid = pid;
        result.ok = true;
        LOG_INFO("Launched " + bundleId + " suspended as pid " + std::to_string(pid));

        // Best effort from here on
        std::string limitError;
        DtxAux limitArgs;
        limitArgs.appendU32(static_cast<std::uint32_t>(pid));
        DtxMessage limitReply;
        if (send(kProcessControlChannel, "requestDisableMemoryLimitsForPid:", limitArgs, true, identifier,
                 limitError) &&
            awaitReply(identifier, limitReply, limitError)) {
            PlistPtr lifted = unarchive(limitReply.payload, ok);
            plist_t flag = static_cast<plist_t>(lifted.get());
            if (ok && flag && plist_get_node_type(flag) == PLIST_BOOLEAN) {
                std::uint8_t value = 0;
                plist_get_bool_val(flag, &value);
                result.memoryLimitLifted = value != 0;
            }
        }
        if (!result.memoryLimitLifted) {
            LOG_WARN("Could not lift memory limit for pid " + std::to_string(pid) +
                     (limitError.empty() ? "" : ": " + limitError));
        }
        stream_.close();
        return result;
    } catch (const std::exception& e) {
        stream_.close();
        if (!result.ok) {
            result.error = std::string("process control failed: ") + e.what();
        }
        return result;
    }
}

bool ProcessControlClient::checkIn(std::string& error) {
    PlistPtr request = adopt(plist_new_dict());
    plist_t node = static_cast<plist_t>(request.get());
    plist_dict_set_item(node, "Label", plist_new_string(label_.c_str()));
    plist_dict_set_item(node, "ProtocolVersion", plist_new_string("2"));
    plist_dict_set_item(node, "Request", plist_new_string("RSDCheckin"));
    if (!sendPlist(stream_, node, error)) {
        return false;
    }
    return expectRequest(stream_, "RSDCheckin", error) && expectRequest(stream_, "StartService", error);
}

bool ProcessControlClient::exchangeCapabilities(std::string& error) {
    PlistPtr capabilities = adopt(plist_new_dict());
    plist_t node = static_cast<plist_t>(capabilities.get());
    plist_dict_set_item(node, "com.apple.private.DTXBlockCompression", plist_new_uint(0));
    plist_dict_set_item(node, "com.apple.private.DTXConnection", plist_new_uint(1));

    DtxAux aux;
    aux.appendObject(archive(node));
    std::uint32_t identifier = 0;
    if (!send(0, "_notifyOfPublishedCapabilities:", aux, false, identifier, error)) {
        return false;
    }

    for (int i = 0; i < kMaxUnrelated; ++i) {
        DtxMessage message;
        if (!receive(message, error)) {
            return false;
        }
        if (selectorOf(message) == "_notifyOfPublishedCapabilities:") {
            return true;
        }
    }
    error = "device never published its capabilities";
    return false;
}

bool ProcessControlClient::openChannel(std::uint32_t code, const std::string& service, std::string& error) {
    DtxAux aux;
    aux.appendU32(code).appendObject(archiveString(service));
    std::uint32_t identifier = 0;
    DtxMessage reply;
    if (!send(0, "_requestChannelWithCode:identifier:", aux, true, identifier, error) ||
        !awaitReply(identifier, reply, error)) {
        return false;
    }
    // An error reply carries an archived NSError
    if (!reply.payload.empty()) {
        bool ok = false;
        PlistPtr value = unarchive(reply.payload, ok);
        if (ok && value && plist_get_node_type(static_cast<plist_t>(value.get())) == PLIST_DICT) {
            auto reason = findStringValue(static_cast<plist_t>(value.get()), "NSLocalizedDescription");
            error = "channel " + service + " refused" + (reason ? ": " + *reason : "");
            return false;
        }
    }
    LOG_DEBUG("Opened DTX channel " + std::to_string(code) + " for " + service);
    return true;
}

bool ProcessControlClient::send(std::uint32_t channel, const std::string& selector, const DtxAux& aux,
                                bool expectsReply, std::uint32_t& identifier, std::string& error) {
    DtxMessage message;
    message.identifier = nextIdentifier_++;
    message.channel = channel;
    message.expectsReply = expectsReply;
    message.aux = aux.encode();
    message.payload = archiveString(selector);
    identifier = message.identifier;

    if (!stream_.sendAll(encodeDtxMessage(message))) {
        error = "DTX write (" + selector + ") failed: " + stream_.error();
        return false;
    }
    LOG_TRACE("DTX -> " + selector + " #" + std::to_string(identifier));
    return true;
}

bool ProcessControlClient::receive(DtxMessage& out, std::string& error) {
    Bytes body;
    std::uint16_t expected = 1;
    for (std::uint16_t fragment = 0; fragment < expected; ++fragment) {
        Bytes raw;
        if (!stream_.recvExact(kDtxHeaderSize, raw)) {
            error = "DTX read failed: " + stream_.error();
            return false;
        }
        auto header = decodeDtxHeader(raw.data());
        if (!header) {
            error = "malformed DTX header";
            return false;
        }
        if (fragment == 0) {
            expected = header->fragmentCount;
            out.identifier = header->identifier;
            out.conversationIndex = header->conversationIndex;
            out.channel = header->channel;
            out.expectsReply = header->expectsReply;
            // The first of several fragments is a bare header.
            if (expected > 1) {
                continue;
            }
        }
        if (header->length > kMaxBody || body.size() + header->length > kMaxBody) {
            error = "DTX message too large";
            return false;
        }
        Bytes chunk;
        if (header->length > 0 && !stream_.recvExact(header->length, chunk)) {
            error = "DTX read failed: " + stream_.error();
            return false;
        }
        body.insert(body.end(), chunk.begin(), chunk.end());
    }

    if (!decodeDtxBody(body, out)) {
        error = "malformed DTX payload";
        return false;
    }
    return true;
}

bool ProcessControlClient::awaitReply(std::uint32_t identifier, DtxMessage& out, std::string& error) {
    for (int i = 0; i < kMaxUnrelated; ++i) {
        if (!receive(out, error)) {
            return false;
        }
        if (out.identifier == identifier && out.conversationIndex > 0) {
            return true;
        }
        LOG_TRACE("DTX <- unrelated message #" + std::to_string(out.identifier));
    }
    error = "no reply to DTX message #" + std::to_string(identifier);
    return false;
}

}
