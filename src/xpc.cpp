/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/xpc.hpp"
#include <cstring>

namespace jitstream {

namespace {
constexpr std::uint32_t kWrapperMagic = 0x29b00b92;
constexpr std::uint32_t kPayloadMagic = 0x42133742;
constexpr std::uint32_t kProtocolVersion = 5;
constexpr std::size_t kWrapperSize = 24;
constexpr int kMaxDepth = 32;

std::size_t padded(std::size_t n) noexcept {
    return (n + 3) & ~static_cast<std::size_t>(3);
}

void pad(Bytes& out) {
    while (out.size() % 4 != 0) {
        out.push_back(0);
    }
}

void patchU32le(Bytes& out, std::size_t at, std::uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out[at + i] = static_cast<std::uint8_t>(value >> (8 * i));
    }
}

bool take(std::size_t size, std::size_t& offset, std::size_t n) noexcept {
    if (offset > size || size - offset < n) {
        return false;
    }
    offset += n;
    return true;
}
}

XpcValue XpcValue::boolean(bool value) {
    XpcValue v;
    v.type_ = XpcType::Bool;
    v.bool_ = value;
    return v;
}

XpcValue XpcValue::int64(std::int64_t value) {
    XpcValue v;
    v.type_ = XpcType::Int64;
    v.scalar_ = static_cast<std::uint64_t>(value);
    return v;
}

XpcValue XpcValue::uint64(std::uint64_t value) {
    XpcValue v;
    v.type_ = XpcType::Uint64;
    v.scalar_ = value;
    return v;
}

XpcValue XpcValue::real(double value) {
    XpcValue v;
    v.type_ = XpcType::Double;
    v.real_ = value;
    return v;
}

XpcValue XpcValue::date(std::int64_t value) {
    XpcValue v;
    v.type_ = XpcType::Date;
    v.scalar_ = static_cast<std::uint64_t>(value);
    return v;
}

XpcValue XpcValue::data(Bytes value) {
    XpcValue v;
    v.type_ = XpcType::Data;
    v.bytes_ = std::move(value);
    return v;
}

XpcValue XpcValue::string(std::string value) {
    XpcValue v;
    v.type_ = XpcType::String;
    v.string_ = std::move(value);
    return v;
}

XpcValue XpcValue::uuid(Bytes value) {
    XpcValue v;
    v.type_ = XpcType::Uuid;
    value.resize(16, 0);
    v.bytes_ = std::move(value);
    return v;
}

XpcValue XpcValue::array() {
    XpcValue v;
    v.type_ = XpcType::Array;
    return v;
}

XpcValue XpcValue::dictionary() {
    XpcValue v;
    v.type_ = XpcType::Dictionary;
    return v;
}

XpcValue& XpcValue::push(XpcValue value) {
    values_.push_back(std::move(value));
    return *this;
}

XpcValue& XpcValue::set(std::string key, XpcValue value) {
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) {
            values_[i] = std::move(value);
            return *this;
        }
    }
    keys_.push_back(std::move(key));
    values_.push_back(std::move(value));
    return *this;
}

const XpcValue* XpcValue::find(const std::string& key) const noexcept {
    if (type_ != XpcType::Dictionary) {
        return nullptr;
    }
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) {
            return &values_[i];
        }
    }
    return nullptr;
}

std::size_t XpcValue::size() const noexcept {
    return values_.size();
}

std::optional<std::string> XpcValue::asString() const {
    if (type_ != XpcType::String) {
        return std::nullopt;
    }
    return string_;
}

std::optional<std::uint64_t> XpcValue::asUint64() const noexcept {
    if (type_ == XpcType::Uint64 || type_ == XpcType::Int64 || type_ == XpcType::Date) {
        return scalar_;
    }
    return std::nullopt;
}

std::optional<double> XpcValue::asDouble() const noexcept {
    if (type_ != XpcType::Double) {
        return std::nullopt;
    }
    return real_;
}

std::optional<bool> XpcValue::asBool() const noexcept {
    if (type_ != XpcType::Bool) {
        return std::nullopt;
    }
    return bool_;
}

void encodeXpcObject(const XpcValue& value, Bytes& out) {
    putU32le(out, static_cast<std::uint32_t>(value.type()));
    switch (value.type()) {
        case XpcType::Null:
            break;
        case XpcType::Bool:
            putU32le(out, value.asBool().value_or(false) ? 1 : 0);
            break;
        case XpcType::Int64:
        case XpcType::Uint64:
        case XpcType::Date:
            putU64le(out, value.asUint64().value_or(0));
            break;
        case XpcType::Double: {
            double d = value.asDouble().value_or(0.0);
            std::uint64_t bits = 0;
            std::memcpy(&bits, &d, sizeof(bits));
            putU64le(out, bits);
            break;
        }
        case XpcType::Data:
            putU32le(out, static_cast<std::uint32_t>(value.bytes().size()));
            out.insert(out.end(), value.bytes().begin(), value.bytes().end());
            pad(out);
            break;
        case XpcType::String: {
            std::string text = value.asString().value_or("");
            putU32le(out, static_cast<std::uint32_t>(text.size() + 1));
            out.insert(out.end(), text.begin(), text.end());
            out.push_back(0);
            pad(out);
            break;
        }
        case XpcType::Uuid:
            out.insert(out.end(), value.bytes().begin(), value.bytes().end());
            break;
        case XpcType::Array:
        case XpcType::Dictionary: {
            std::size_t lengthAt = out.size();
            putU32le(out, 0);
            std::size_t start = out.size();
            putU32le(out, static_cast<std::uint32_t>(value.size()));
            for (std::size_t i = 0; i < value.size(); ++i) {
                if (value.type() == XpcType::Dictionary) {
                    const std::string& key = value.keys()[i];
                    out.insert(out.end(), key.begin(), key.end());
                    out.push_back(0);
                    pad(out);
                }
                encodeXpcObject(value.values()[i], out);
            }
            patchU32le(out, lengthAt, static_cast<std::uint32_t>(out.size() - start));
            break;
        }
    }
}

bool decodeXpcObject(const std::uint8_t* data, std::size_t size, std::size_t& offset,
                     XpcValue& out, int depth) {
    if (depth > kMaxDepth) {
        return false;
    }
    std::size_t at = offset;
    if (!take(size, offset, 4)) return false;
    auto type = static_cast<XpcType>(readU32le(data + at));

    switch (type) {
        case XpcType::Null:
            out = XpcValue::null();
            return true;
        case XpcType::Bool:
            at = offset;
            if (!take(size, offset, 4)) return false;
            out = XpcValue::boolean(data[at] != 0);
            return true;
        case XpcType::Int64:
            at = offset;
            if (!take(size, offset, 8)) return false;
            out = XpcValue::int64(static_cast<std::int64_t>(readU64le(data + at)));
            return true;
        case XpcType::Uint64:
            at = offset;
            if (!take(size, offset, 8)) return false;
            out = XpcValue::uint64(readU64le(data + at));
            return true;
        case XpcType::Date:
            at = offset;
            if (!take(size, offset, 8)) return false;
            out = XpcValue::date(static_cast<std::int64_t>(readU64le(data + at)));
            return true;
        case XpcType::Double: {
            at = offset;
            if (!take(size, offset, 8)) return false;
            std::uint64_t bits = readU64le(data + at);
            double d = 0.0;
            std::memcpy(&d, &bits, sizeof(d));
            out = XpcValue::real(d);
            return true;
        }
        case XpcType::Data: {
            at = offset;
            if (!take(size, offset, 4)) return false;
            std::size_t length = readU32le(data + at);
            at = offset;
            if (!take(size, offset, padded(length))) return false;
            out = XpcValue::data(Bytes(data + at, data + at + length));
            return true;
        }
        case XpcType::String: {
            at = offset;
            if (!take(size, offset, 4)) return false;
            std::size_t length = readU32le(data + at);
            at = offset;
            if (!take(size, offset, padded(length))) return false;
            std::string text(reinterpret_cast<const char*>(data + at), length);
            auto nul = text.find('\0');
            if (nul != std::string::npos) {
                text.resize(nul);
            }
            out = XpcValue::string(std::move(text));
            return true;
        }
        case XpcType::Uuid:
            at = offset;
            if (!take(size, offset, 16)) return false;
            out = XpcValue::uuid(Bytes(data + at, data + at + 16));
            return true;
        case XpcType::Array:
        case XpcType::Dictionary: {
            at = offset;
            if (!take(size, offset, 8)) return false;
            std::size_t byteLength = readU32le(data + at);
            std::uint32_t count = readU32le(data + at + 4);
            std::size_t end = at + 4 + byteLength;
            if (byteLength < 4 || end > size) return false;

            out = type == XpcType::Array ? XpcValue::array() : XpcValue::dictionary();
            for (std::uint32_t i = 0; i < count; ++i) {
                std::string key;
                if (type == XpcType::Dictionary) {
                    const void* nul = std::memchr(data + offset, 0, end - offset);
                    if (!nul) return false;
                    std::size_t keyLength = static_cast<const std::uint8_t*>(nul) - (data + offset);
                    key.assign(reinterpret_cast<const char*>(data + offset), keyLength);
                    if (!take(end, offset, padded(keyLength + 1))) return false;
                }
                XpcValue child;
                if (!decodeXpcObject(data, end, offset, child, depth + 1)) return false;
                if (type == XpcType::Dictionary) {
                    out.set(std::move(key), std::move(child));
                } else {
                    out.push(std::move(child));
                }
            }
            offset = end;
            return true;
        }
    }
    return false;
}

Bytes encodeXpcMessage(const XpcMessage& message) {
    Bytes payload;
    if (message.body) {
        putU32le(payload, kPayloadMagic);
        putU32le(payload, kProtocolVersion);
        encodeXpcObject(*message.body, payload);
    }

    Bytes out;
    out.reserve(kWrapperSize + payload.size());
    putU32le(out, kWrapperMagic);
    putU32le(out, message.flags);
    putU64le(out, payload.size());
    putU64le(out, message.messageId);
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

XpcDecode decodeXpcMessage(const std::uint8_t* data, std::size_t size, XpcMessage& out, std::size_t& consumed) {
    if (size < kWrapperSize) {
        return XpcDecode::NeedMore;
    }
    if (readU32le(data) != kWrapperMagic) {
        return XpcDecode::Invalid;
    }
    std::uint64_t bodySize = readU64le(data + 8);
    if (bodySize > (64U << 20)) {
        return XpcDecode::Invalid;
    }
    if (size - kWrapperSize < bodySize) {
        return XpcDecode::NeedMore;
    }

    out.flags = readU32le(data + 4);
    out.messageId = readU64le(data + 16);
    out.body.reset();

    if (bodySize > 0) {
        const std::uint8_t* body = data + kWrapperSize;
        std::size_t length = static_cast<std::size_t>(bodySize);
        if (length < 8 || readU32le(body) != kPayloadMagic) {
            return XpcDecode::Invalid;
        }
        std::size_t offset = 8;
        XpcValue root;
        if (!decodeXpcObject(body, length, offset, root)) {
            return XpcDecode::Invalid;
        }
        out.body = std::move(root);
    }
    consumed = kWrapperSize + static_cast<std::size_t>(bodySize);
    return XpcDecode::Complete;
}

}
