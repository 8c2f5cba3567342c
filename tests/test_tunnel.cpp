/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "jitstream/tunnel.hpp"

using namespace jitstream;

namespace {
// Answers with a tunnel from the n-th lookup on; 0 means never.
class CountingDirectory final : public TunnelDirectory {
public:
    explicit CountingDirectory(int appearsAt) : appearsAt_(appearsAt) {}

    std::optional<TunnelDescriptor> lookup(const DeviceId& device) noexcept override {
        ++lookups;
        if (appearsAt_ == 0 || lookups < appearsAt_) {
            return std::nullopt;
        }
        return TunnelDescriptor{device, "fd00::1", 58783, "utun4"};
    }

    int lookups = 0;

private:
    int appearsAt_;
};
}

TEST(TunnelWait, StopsAtFirstSuccessfulLookup) {
    CountingDirectory directory(7);
    int sleeps = 0;
    auto tunnel = waitForTunnel(directory, "A", 100, std::chrono::milliseconds(100),
                                [&](std::chrono::milliseconds d) {
                                    EXPECT_EQ(d, std::chrono::milliseconds(100));
                                    ++sleeps;
                                });

    ASSERT_TRUE(tunnel.has_value());
    EXPECT_EQ(tunnel->address, "fd00::1");
    EXPECT_EQ(tunnel->port, 58783);
    EXPECT_EQ(directory.lookups, 7);
    EXPECT_EQ(sleeps, 6);
}

TEST(TunnelWait, GivesUpAfterLastAttempt) {
    CountingDirectory directory(0);
    int sleeps = 0;
    auto tunnel = waitForTunnel(directory, "A", 100, std::chrono::milliseconds(100),
                                [&](std::chrono::milliseconds) { ++sleeps; });

    EXPECT_FALSE(tunnel.has_value());
    EXPECT_EQ(directory.lookups, 100);
    EXPECT_EQ(sleeps, 99);
}

TEST(TunneldListing, ParsesNumericAndStringPorts) {
    std::string body = R"({
        "00008101-AAAA": [{"tunnel-address": "fd7b::1", "tunnel-port": 61234, "interface": "utun3"}],
        "00008101-BBBB": [{"tunnel-address": "fd7c::1", "tunnel-port": "50000"}]
    })";
    std::vector<TunnelDescriptor> tunnels;
    std::string error;
    ASSERT_TRUE(parseTunneldListing(body, tunnels, error)) << error;
    ASSERT_EQ(tunnels.size(), 2u);

    for (const auto& tunnel : tunnels) {
        if (tunnel.deviceId == "00008101-AAAA") {
            EXPECT_EQ(tunnel.address, "fd7b::1");
            EXPECT_EQ(tunnel.port, 61234);
            EXPECT_EQ(tunnel.interface, "utun3");
        } else {
            EXPECT_EQ(tunnel.deviceId, "00008101-BBBB");
            EXPECT_EQ(tunnel.port, 50000);
        }
    }
}

TEST(TunneldListing, SkipsIncompleteEntries) {
    std::string body = R"({
        "A": [{"tunnel-port": 1}],
        "B": [{"tunnel-address": "fd00::2", "tunnel-port": "not-a-port"}],
        "C": "garbage"
    })";
    std::vector<TunnelDescriptor> tunnels;
    std::string error;
    ASSERT_TRUE(parseTunneldListing(body, tunnels, error));
    EXPECT_TRUE(tunnels.empty());
}

TEST(TunneldListing, RejectsNonObjectBodies) {
    std::vector<TunnelDescriptor> tunnels;
    std::string error;
    EXPECT_FALSE(parseTunneldListing("[1,2]", tunnels, error));
    EXPECT_FALSE(parseTunneldListing("{not json", tunnels, error));
    EXPECT_FALSE(error.empty());
}
