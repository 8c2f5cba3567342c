/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "jitstream/net.hpp"

namespace jitstream {

// Object type tags of the XPC wire format (little-endian throughout).
enum class XpcType : std::uint32_t {
    Null = 0x1000,
    Bool = 0x2000,
    Int64 = 0x3000,
    Uint64 = 0x4000,
    Double = 0x5000,
    Date = 0x7000,
    Data = 0x8000,
    String = 0x9000,
    Uuid = 0xa000,
    Array = 0xe000,
    Dictionary = 0xf000
};

namespace xpc_flags {
constexpr std::uint32_t AlwaysSet = 0x00000001;
constexpr std::uint32_t Ping = 0x00000002;
constexpr std::uint32_t DataPresent = 0x00000100;
constexpr std::uint32_t WantingReply = 0x00010000;
constexpr std::uint32_t Reply = 0x00020000;
constexpr std::uint32_t FileTxStreamRequest = 0x00100000;
constexpr std::uint32_t FileTxStreamResponse = 0x00200000;
constexpr std::uint32_t InitHandshake = 0x00400000;
}

class XpcValue {
public:
    XpcValue() noexcept = default;

    static XpcValue null() { return XpcValue(); }
    static XpcValue boolean(bool value);
    static XpcValue int64(std::int64_t value);
    static XpcValue uint64(std::uint64_t value);
    static XpcValue real(double value);
    static XpcValue date(std::int64_t value);
    static XpcValue data(Bytes value);
    static XpcValue string(std::string value);
    static XpcValue uuid(Bytes value);
    static XpcValue array();
    static XpcValue dictionary();

    [[nodiscard]] XpcType type() const noexcept { return type_; }

    // Array / dictionary building
    XpcValue& push(XpcValue value);
    XpcValue& set(std::string key, XpcValue value);

    [[nodiscard]] const XpcValue* find(const std::string& key) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] const std::vector<std::string>& keys() const noexcept { return keys_; }
    [[nodiscard]] const std::vector<XpcValue>& values() const noexcept { return values_; }

    [[nodiscard]] std::optional<std::string> asString() const;
    [[nodiscard]] std::optional<std::uint64_t> asUint64() const noexcept;
    [[nodiscard]] std::optional<bool> asBool() const noexcept;
    [[nodiscard]] std::optional<double> asDouble() const noexcept;
    [[nodiscard]] const Bytes& bytes() const noexcept { return bytes_; }

private:
    XpcType type_ = XpcType::Null;
    bool bool_ = false;
    std::uint64_t scalar_ = 0;   // int64/uint64/date bit pattern
    double real_ = 0.0;
    std::string string_;
    Bytes bytes_;
    std::vector<std::string> keys_;     // dictionary only, parallel to values_
    std::vector<XpcValue> values_;      // array elements or dictionary values
};

void encodeXpcObject(const XpcValue& value, Bytes& out);
// depth guards against hostile nesting.
[[nodiscard]] bool decodeXpcObject(const std::uint8_t* data, std::size_t size, std::size_t& offset,
                                   XpcValue& out, int depth = 0);

struct XpcMessage {
    std::uint32_t flags = xpc_flags::AlwaysSet;
    std::uint64_t messageId = 0;
    std::optional<XpcValue> body;
};

// Wrapper: magic, flags, payload size, message id, then the optional payload
// (payload magic, protocol version, root object).
[[nodiscard]] Bytes encodeXpcMessage(const XpcMessage& message);

enum class XpcDecode : std::uint8_t { Complete, NeedMore, Invalid };

// Decodes one message from the front of data; consumed is set on Complete.
[[nodiscard]] XpcDecode decodeXpcMessage(const std::uint8_t* data, std::size_t size,
                                         XpcMessage& out, std::size_t& consumed);

}
