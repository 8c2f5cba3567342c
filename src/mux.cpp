/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/mux.hpp"
#include "jitstream/logger.hpp"
#include "jitstream/plist.hpp"

namespace jitstream {

namespace {
constexpr std::uint32_t kMaxMuxPacket = 1U << 20;

void setString(plist_t dict, const char* key, const std::string& value) {
    plist_dict_set_item(dict, key, plist_new_string(value.c_str()));
}
}

Bytes encodeMuxPacket(const std::string& payload, std::uint32_t tag) {
    Bytes out;
    out.reserve(kMuxHeaderSize + payload.size());
    putU32le(out, static_cast<std::uint32_t>(kMuxHeaderSize + payload.size()));
    putU32le(out, 1);
    putU32le(out, 8);
    putU32le(out, tag);
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

std::optional<MuxHeader> decodeMuxHeader(const Bytes& data) noexcept {
    if (data.size() < kMuxHeaderSize) {
        return std::nullopt;
    }
    MuxHeader header;
    header.length = readU32le(data.data());
    header.version = readU32le(data.data() + 4);
    header.message = readU32le(data.data() + 8);
    header.tag = readU32le(data.data() + 12);
    if (header.length < kMuxHeaderSize || header.length > kMaxMuxPacket) {
        return std::nullopt;
    }
    return header;
}

std::string buildMuxRequest(MuxRequest request, const DeviceId& device, const std::string& address) {
    PlistPtr dict = adopt(plist_new_dict());
    plist_t root = static_cast<plist_t>(dict.get());
    if (request == MuxRequest::AddDevice) {
        setString(root, "MessageType", "AddDevice");
        setString(root, "ConnectionType", "Network");
        setString(root, "ServiceName", kMuxServiceName);
        setString(root, "IPAddress", address);
    } else {
        setString(root, "MessageType", "RemoveDevice");
    }
    setString(root, "DeviceID", device);
    return toXml(root);
}

std::string buildPairRecordRequest(const DeviceId& device, const Bytes& record) {
    PlistPtr dict = adopt(plist_new_dict());
    plist_t root = static_cast<plist_t>(dict.get());
    setString(root, "MessageType", "SavePairRecord");
    setString(root, "PairRecordID", device);
    plist_dict_set_item(root, "PairRecordData",
                        plist_new_data(reinterpret_cast<const char*>(record.data()), record.size()));
    return toXml(root);
}

std::optional<std::uint64_t> parseMuxResult(const Bytes& payload) noexcept {
    try {
        PlistPtr reply = parsePlist(payload);
        if (!reply) {
            return std::nullopt;
        }
        return dictUint(static_cast<plist_t>(reply.get()), "Result");
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

RegisterResult UsbmuxRegistrar::addDevice(const DeviceId& device, const std::string& address) noexcept {
    try {
        return exchange("AddDevice", device, buildMuxRequest(MuxRequest::AddDevice, device, address), 1);
    } catch (const std::exception& e) {
        return {false, std::string("AddDevice failed: ") + e.what()};
    }
}

RegisterResult UsbmuxRegistrar::removeDevice(const DeviceId& device) noexcept {
    try {
        return exchange("RemoveDevice", device, buildMuxRequest(MuxRequest::RemoveDevice, device, {}), 1);
    } catch (const std::exception& e) {
        return {false, std::string("RemoveDevice failed: ") + e.what()};
    }
}

// usbmuxd answers SavePairRecord with Result 0 on success.
RegisterResult UsbmuxRegistrar::savePairRecord(const DeviceId& device, const Bytes& record) noexcept {
    try {
        return exchange("SavePairRecord", device, buildPairRecordRequest(device, record), 0);
    } catch (const std::exception& e) {
        return {false, std::string("SavePairRecord failed: ") + e.what()};
    }
}

RegisterResult UsbmuxRegistrar::exchange(const char* name, const DeviceId& device, const std::string& body,
                                         std::uint64_t accepted) noexcept {
    RegisterResult result;
    try {
        Stream stream;
        if (!stream.connectUnix(socketPath_)) {
            result.error = "multiplexer unreachable: " + stream.error();
            return result;
        }

        if (body.empty()) {
            result.error = std::string("failed to serialise ") + name + " request";
            return result;
        }
        if (!stream.sendAll(encodeMuxPacket(body, nextTag_++))) {
            result.error = "multiplexer write failed: " + stream.error();
            return result;
        }

        Bytes head;
        if (!stream.recvExact(kMuxHeaderSize, head)) {
            result.error = "multiplexer read failed: " + stream.error();
            return result;
        }
        auto header = decodeMuxHeader(head);
        if (!header) {
            result.error = "malformed multiplexer response header";
            return result;
        }

        Bytes payload;
        if (header->length > kMuxHeaderSize &&
            !stream.recvExact(header->length - kMuxHeaderSize, payload)) {
            result.error = "multiplexer read failed: " + stream.error();
            return result;
        }

        auto code = parseMuxResult(payload);
        if (!code) {
            result.error = "multiplexer response carried no Result";
            return result;
        }
        if (*code != accepted) {
            result.error = std::string(name) + " rejected by multiplexer (Result " + std::to_string(*code) + ")";
            return result;
        }

        LOG_DEBUG(std::string(name) + " accepted for " + device);
        result.ok = true;
        return result;
    } catch (const std::exception& e) {
        result.ok = false;
        result.error = std::string(name) + " failed: " + e.what();
        return result;
    }
}

}
