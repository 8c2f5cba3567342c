/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "jitstream/failure.hpp"
#include "jitstream/types.hpp"

namespace jitstream {

class Database;

struct EntryMetadata {
    std::optional<std::string> address;
    std::optional<std::string> bundleId;
};

struct EnqueueResult {
    bool ok = false;
    Ordinal ordinal = 0;
    bool duplicate = false;   // device already had a live entry of this kind
    Failure failure;
    explicit operator bool() const noexcept { return ok; }
};

enum class QueueState : std::uint8_t {
    NotQueued,
    Queued,
    InProgress,
    Failed,
    BackendError
};

struct QueueStatus {
    QueueState state = QueueState::NotQueued;
    std::size_t position = 0;   // Queued only
    std::string message;        // Failed / BackendError

    static QueueStatus notQueued() { return {}; }
    static QueueStatus queuedAt(std::size_t position) { return {QueueState::Queued, position, {}}; }
    static QueueStatus inProgress() { return {QueueState::InProgress, 0, {}}; }
    static QueueStatus failed(std::string message) { return {QueueState::Failed, 0, std::move(message)}; }
    static QueueStatus backendError(std::string message) {
        return {QueueState::BackendError, 0, std::move(message)};
    }
};

struct ClaimResult {
    bool ok = false;
    std::optional<QueueEntry> entry;   // empty when nothing is pending
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

struct QueueStoreOptions {
    std::filesystem::path database;
    int attempts = 5;
    std::chrono::milliseconds backoff{100};
    std::chrono::milliseconds busyTimeout{0};
    Sleeper sleep;   // defaults to std::this_thread::sleep_for
};

/*
 * Mount and launch queues backed by SQLite. Each operation opens its own
 * connection, so one store is safe to share across worker threads; writers
 * are serialised by SQLite's locking and the bounded retry in enqueue().
 */
class QueueStore final {
public:
    explicit QueueStore(QueueStoreOptions options);

    QueueStore(const QueueStore&) = delete;
    QueueStore& operator=(const QueueStore&) = delete;
    QueueStore(QueueStore&&) = delete;
    QueueStore& operator=(QueueStore&&) = delete;

    [[nodiscard]] bool ensureSchema(std::string& error) noexcept;

    [[nodiscard]] EnqueueResult enqueue(QueueKind kind, const DeviceId& device,
                                        const EntryMetadata& metadata) noexcept;

    // Reading a Failed status consumes the entry.
    [[nodiscard]] QueueStatus queryStatus(QueueKind kind, const DeviceId& device) noexcept;

    [[nodiscard]] bool clear(QueueKind kind, std::string& error) noexcept;

    // Worker side
    [[nodiscard]] ClaimResult claimNext(QueueKind kind) noexcept;
    [[nodiscard]] bool complete(QueueKind kind, Ordinal ordinal) noexcept;
    [[nodiscard]] bool fail(QueueKind kind, Ordinal ordinal, const std::string& message) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return options_.database; }

private:
    enum class Attempt : std::uint8_t { Done, Busy, Failed };

    QueueStoreOptions options_;

    [[nodiscard]] std::unique_ptr<Database> connect(std::string& error) const noexcept;

    // Repeats one storage step while another connection holds the lock, up to
    // options_.attempts times with options_.backoff between tries.
    [[nodiscard]] Attempt retryWhileBusy(const std::string& operation, const std::function<Attempt()>& step) const;
    [[nodiscard]] std::string busyMessage() const;

    [[nodiscard]] Attempt tryEnqueue(Database& db, QueueKind kind, const DeviceId& device,
                                     const EntryMetadata& metadata, EnqueueResult& result) noexcept;
    [[nodiscard]] Attempt tryQueryStatus(Database& db, QueueKind kind, const DeviceId& device,
                                         QueueStatus& status) noexcept;
    [[nodiscard]] Attempt consumeError(Database& db, QueueKind kind, Ordinal ordinal, QueueStatus& status) noexcept;
    [[nodiscard]] Attempt tryClaim(Database& db, QueueKind kind, ClaimResult& result) noexcept;
    [[nodiscard]] Attempt trySettle(Database& db, const std::string& sql, Ordinal ordinal,
                                    const std::string* message, std::string& error) noexcept;
};

[[nodiscard]] std::string describeStatus(const QueueStatus& status);

}
