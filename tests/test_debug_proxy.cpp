/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <functional>
#include <thread>
#include <vector>

#include "jitstream/debug_proxy.hpp"

using namespace jitstream;

TEST(RspPacket, ChecksumIsByteSumModulo256) {
    EXPECT_EQ(rspChecksum(""), 0);
    EXPECT_EQ(rspChecksum("D"), 0x44);
    EXPECT_EQ(encodeRspPacket("D"), "$D#44");
    EXPECT_EQ(encodeRspPacket("vAttach;1f4"), "$vAttach;1f4#d1");
    EXPECT_EQ(encodeRspPacket("QStartNoAckMode"), "$QStartNoAckMode#b0");
}

TEST(RspPacket, TakesPacketsAndSkipsAcks) {
    std::string buffer = "++$OK#9a$T11#";
    bool bad = false;
    auto first = takeRspPacket(buffer, bad);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, "OK");
    EXPECT_FALSE(bad);

    // Second packet is incomplete until its checksum arrives.
    EXPECT_FALSE(takeRspPacket(buffer, bad).has_value());
    EXPECT_FALSE(bad);
    buffer += "b6";
    auto second = takeRspPacket(buffer, bad);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, "T11");
    EXPECT_TRUE(buffer.empty());
}

TEST(RspPacket, WrongChecksumIsFlagged) {
    std::string buffer = "$OK#00";
    bool bad = false;
    EXPECT_FALSE(takeRspPacket(buffer, bad).has_value());
    EXPECT_TRUE(bad);
}

TEST(RspPacket, ErrorRepliesAreRecognised) {
    EXPECT_TRUE(isRspError("E01"));
    EXPECT_FALSE(isRspError("OK"));
    EXPECT_FALSE(isRspError(""));
    EXPECT_FALSE(isRspError("T05thread:1;"));
}

namespace {
// One-connection loopback debugserver; answers each packet through reply().
class FakeDebugServer {
public:
    explicit FakeDebugServer(std::function<std::string(const std::string&)> reply) : reply_(std::move(reply)) {
        listener_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        EXPECT_EQ(::bind(listener_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
        EXPECT_EQ(::listen(listener_, 1), 0);
        socklen_t len = sizeof(addr);
        ::getsockname(listener_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread(&FakeDebugServer::serve, this);
    }

    ~FakeDebugServer() {
        ::shutdown(listener_, SHUT_RDWR);
        ::close(listener_);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

    // Waits for the client to hang up, then returns every packet seen.
    std::vector<std::string> finish() {
        if (thread_.joinable()) {
            thread_.join();
        }
        return received_;
    }

private:
    void serve() {
        int fd = ::accept(listener_, nullptr, nullptr);
        if (fd < 0) {
            return;
        }
        timeval limit{5, 0};
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &limit, sizeof(limit));
        std::string buffer;
        char chunk[512];
        while (true) {
            ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n <= 0) {
                break;
            }
            buffer.append(chunk, static_cast<std::size_t>(n));
            bool bad = false;
            while (auto packet = takeRspPacket(buffer, bad)) {
                received_.push_back(*packet);
                std::string out = "+" + encodeRspPacket(reply_(*packet));
                ::send(fd, out.data(), out.size(), MSG_NOSIGNAL);
            }
        }
        ::close(fd);
    }

    std::function<std::string(const std::string&)> reply_;
    std::vector<std::string> received_;
    int listener_ = -1;
    std::uint16_t port_ = 0;
    std::thread thread_;
};
}

TEST(DebugProxyClient, AttachesThenDetachesConfiguredTimes) {
    FakeDebugServer server([](const std::string& packet) {
        if (packet.rfind("vAttach;", 0) == 0) {
            return std::string("T11thread:1;");
        }
        return std::string("OK");
    });
    DebugProxyClient client(std::chrono::milliseconds(2000));
    AttachResult result = client.attachAndDetach("127.0.0.1", server.port(), 500, 2);
    std::vector<std::string> received = server.finish();

    ASSERT_TRUE(result) << result.error;
    ASSERT_EQ(received.size(), 5u);
    EXPECT_EQ(received[0], "QStartNoAckMode");
    EXPECT_EQ(received[1], "QSetDetachOnError:1");
    EXPECT_EQ(received[2], "vAttach;1f4");
    EXPECT_EQ(received[3], "D");
    EXPECT_EQ(received[4], "D");
}

TEST(DebugProxyClient, RefusedAttachFails) {
    FakeDebugServer server([](const std::string& packet) {
        return packet.rfind("vAttach;", 0) == 0 ? std::string("E01") : std::string("OK");
    });
    DebugProxyClient client(std::chrono::milliseconds(2000));
    auto result = client.attachAndDetach("127.0.0.1", server.port(), 500, 2);
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("E01"), std::string::npos);
}

TEST(DebugProxyClient, OnlyFirstDetachMustSucceed) {
    int detaches = 0;
    FakeDebugServer server([&](const std::string& packet) {
        if (packet == "D") {
            return ++detaches == 1 ? std::string("OK") : std::string("E55");
        }
        return std::string("OK");
    });
    DebugProxyClient client(std::chrono::milliseconds(2000));
    auto result = client.attachAndDetach("127.0.0.1", server.port(), 77, 3);
    EXPECT_TRUE(result) << result.error;
}
