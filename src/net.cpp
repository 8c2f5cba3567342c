/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/net.hpp"
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace jitstream {

Stream::~Stream() {
    close();
}

Stream::Stream(Stream&& other) noexcept
    : fd_(other.fd_), timeout_(other.timeout_), error_(std::move(other.error_)) {
    other.fd_ = -1;
}

Stream& Stream::operator=(Stream&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        timeout_ = other.timeout_;
        error_ = std::move(other.error_);
        other.fd_ = -1;
    }
    return *this;
}

void Stream::fail(const std::string& what) noexcept {
    try {
        error_ = what + ": " + std::strerror(errno);
    } catch (const std::exception&) {
        // keep the previous message
    }
}

void Stream::applyTimeout() noexcept {
    if (fd_ < 0) {
        return;
    }
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout_.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout_.count() % 1000) * 1000);
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

void Stream::setTimeout(std::chrono::milliseconds timeout) noexcept {
    timeout_ = timeout;
    applyTimeout();
}

bool Stream::connectUnix(const std::string& path) noexcept {
    close();

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        error_ = "socket path too long: " + path;
        return false;
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd_ < 0) {
        fail("socket");
        return false;
    }
    applyTimeout();

    if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        fail("connect " + path);
        close();
        return false;
    }
    return true;
}

bool Stream::connectTcp(const std::string& host, std::uint16_t port) noexcept {
    close();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* found = nullptr;
    std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &found);
    if (rc != 0) {
        error_ = "resolve " + host + ": " + gai_strerror(rc);
        return false;
    }

    for (struct addrinfo* ai = found; ai; ai = ai->ai_next) {
        fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd_ < 0) {
            fail("socket");
            continue;
        }
        applyTimeout();
        if (::connect(fd_, ai->ai_addr, ai->ai_addrlen) == 0) {
            int one = 1;
            setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            break;
        }
        fail("connect [" + host + "]:" + service);
        ::close(fd_);
        fd_ = -1;
    }
    ::freeaddrinfo(found);
    return fd_ >= 0;
}

bool Stream::sendAll(const std::uint8_t* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        error_ = "send on closed stream";
        return false;
    }
    std::size_t sent = 0;
    while (sent < size) {
        ssize_t n = ::send(fd_, data + sent, size - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            fail("send");
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

bool Stream::recvExact(std::size_t size, Bytes& out) noexcept {
    try {
        out.resize(size);
    } catch (const std::exception&) {
        error_ = "receive buffer allocation failed";
        return false;
    }
    std::size_t got = 0;
    while (got < size) {
        ssize_t n = ::recv(fd_, out.data() + got, size - got, 0);
        if (n == 0) {
            error_ = "connection closed by peer";
            return false;
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            fail("recv");
            return false;
        }
        got += static_cast<std::size_t>(n);
    }
    return true;
}

bool Stream::recvSome(std::size_t max, Bytes& out) noexcept {
    try {
        out.resize(max);
    } catch (const std::exception&) {
        error_ = "receive buffer allocation failed";
        return false;
    }
    while (true) {
        ssize_t n = ::recv(fd_, out.data(), max, 0);
        if (n == 0) {
            error_ = "connection closed by peer";
            out.clear();
            return false;
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            fail("recv");
            out.clear();
            return false;
        }
        out.resize(static_cast<std::size_t>(n));
        return true;
    }
}

void Stream::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void putU16(Bytes& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value >> 8));
    out.push_back(static_cast<std::uint8_t>(value));
}

void putU32(Bytes& out, std::uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>(value >> shift));
    }
}

void putU64(Bytes& out, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>(value >> shift));
    }
}

std::uint32_t readU32(const std::uint8_t* p) noexcept {
    return (std::uint32_t(p[0]) << 24) | (std::uint32_t(p[1]) << 16) |
           (std::uint32_t(p[2]) << 8) | std::uint32_t(p[3]);
}

std::uint64_t readU64(const std::uint8_t* p) noexcept {
    return (std::uint64_t(readU32(p)) << 32) | readU32(p + 4);
}

void putU32le(Bytes& out, std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<std::uint8_t>(value >> shift));
    }
}

void putU64le(Bytes& out, std::uint64_t value) {
    for (int shift = 0; shift < 64; shift += 8) {
        out.push_back(static_cast<std::uint8_t>(value >> shift));
    }
}

std::uint16_t readU16le(const std::uint8_t* p) noexcept {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t readU32le(const std::uint8_t* p) noexcept {
    return std::uint32_t(p[0]) | (std::uint32_t(p[1]) << 8) |
           (std::uint32_t(p[2]) << 16) | (std::uint32_t(p[3]) << 24);
}

std::uint64_t readU64le(const std::uint8_t* p) noexcept {
    return std::uint64_t(readU32le(p)) | (std::uint64_t(readU32le(p + 4)) << 32);
}

}
