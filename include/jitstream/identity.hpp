/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <utility>

#include "jitstream/failure.hpp"
#include "jitstream/net.hpp"
#include "jitstream/types.hpp"

namespace jitstream {

// Host pairing record, handed as-is to the multiplexer before registration.
struct PairingRecord {
    std::string hostId;
    Bytes data;
};

struct Identity {
    bool ok = false;
    DeviceId deviceId;
    PairingRecord pairing;
    Failure failure;
    explicit operator bool() const noexcept { return ok; }
};

// "1.2.3.4" -> "::ffff:1.2.3.4"; anything else is returned as given.
[[nodiscard]] std::string normalizeAddress(const std::string& address);

// Reads <dir>/<device>.plist; HostID and SystemBUID are required.
// Keeps the raw bytes for the multiplexer.
[[nodiscard]] bool loadPairingRecord(const std::filesystem::path& dir, const DeviceId& device,
                                     PairingRecord& out, std::string& error) noexcept;

// Source address -> registered device and its pairing credentials.
class IdentityResolver {
public:
    virtual ~IdentityResolver() = default;
    [[nodiscard]] virtual Identity resolve(const std::string& sourceAddress) noexcept = 0;
    virtual void touch(const DeviceId& device) noexcept = 0;
};

class DeviceRegistry final : public IdentityResolver {
public:
    DeviceRegistry(std::filesystem::path database, std::filesystem::path pairingDir,
                   std::chrono::milliseconds busyTimeout = std::chrono::milliseconds(1000))
        : database_(std::move(database)), pairingDir_(std::move(pairingDir)), busyTimeout_(busyTimeout) {}

    [[nodiscard]] Identity resolve(const std::string& sourceAddress) noexcept override;
    void touch(const DeviceId& device) noexcept override;

    // Inserts or replaces the record for device at address.
    [[nodiscard]] bool registerDevice(const DeviceId& device, const std::string& address,
                                      std::string& error) noexcept;

private:
    std::filesystem::path database_;
    std::filesystem::path pairingDir_;
    std::chrono::milliseconds busyTimeout_;
};

}
