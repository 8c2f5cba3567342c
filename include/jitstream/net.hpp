/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace jitstream {

using Bytes = std::vector<std::uint8_t>;

// Blocking stream socket. Owns the descriptor; every call reports failure
// through its return value and fills error().
class Stream final {
public:
    Stream() noexcept = default;
    ~Stream();

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;
    Stream(Stream&& other) noexcept;
    Stream& operator=(Stream&& other) noexcept;

    [[nodiscard]] bool connectUnix(const std::string& path) noexcept;
    // host may be an IPv4 or IPv6 literal or a name.
    [[nodiscard]] bool connectTcp(const std::string& host, std::uint16_t port) noexcept;

    void setTimeout(std::chrono::milliseconds timeout) noexcept;

    [[nodiscard]] bool sendAll(const std::uint8_t* data, std::size_t size) noexcept;
    [[nodiscard]] bool sendAll(const Bytes& data) noexcept { return sendAll(data.data(), data.size()); }
    [[nodiscard]] bool sendAll(const std::string& data) noexcept {
        return sendAll(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
    }

    [[nodiscard]] bool recvExact(std::size_t size, Bytes& out) noexcept;
    // Up to max bytes; false on error or orderly close.
    [[nodiscard]] bool recvSome(std::size_t max, Bytes& out) noexcept;

    void close() noexcept;
    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& error() const noexcept { return error_; }

private:
    int fd_ = -1;
    std::chrono::milliseconds timeout_{10000};
    std::string error_;

    void fail(const std::string& what) noexcept;
    void applyTimeout() noexcept;
};

// Big-endian helpers shared by the device protocols.
void putU16(Bytes& out, std::uint16_t value);
void putU32(Bytes& out, std::uint32_t value);
void putU64(Bytes& out, std::uint64_t value);
[[nodiscard]] std::uint32_t readU32(const std::uint8_t* p) noexcept;
[[nodiscard]] std::uint64_t readU64(const std::uint8_t* p) noexcept;

// Little-endian
void putU32le(Bytes& out, std::uint32_t value);
void putU64le(Bytes& out, std::uint64_t value);
[[nodiscard]] std::uint16_t readU16le(const std::uint8_t* p) noexcept;
[[nodiscard]] std::uint32_t readU32le(const std::uint8_t* p) noexcept;
[[nodiscard]] std::uint64_t readU64le(const std::uint8_t* p) noexcept;

}
