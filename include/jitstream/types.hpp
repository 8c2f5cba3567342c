#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace jitstream {

// Stable device identifier (UDID), independent of network address.
using DeviceId = std::string;

// Queue ordinal; SQLite AUTOINCREMENT key, never reused within a kind.
using Ordinal = std::int64_t;

using Pid = std::uint64_t;

enum class QueueKind : std::uint8_t { Mount, Launch };

// Persisted as integers 0/1/2 in the queue tables.
enum class EntryStatus : std::uint8_t { Pending = 0, InProgress = 1, Error = 2 };

struct QueueEntry {
    Ordinal ordinal = 0;
    QueueKind kind = QueueKind::Mount;
    DeviceId deviceId;
    std::optional<std::string> address;
    std::optional<std::string> bundleId;
    EntryStatus status = EntryStatus::Pending;
    std::string error;
};

struct TunnelDescriptor {
    DeviceId deviceId;
    std::string address;
    std::uint16_t port = 0;
    std::string interface;
};

// Injectable wait, so retry and poll loops can be tested without sleeping.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

const char* queueKindName(QueueKind kind) noexcept;

}
