/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "jitstream/types.hpp"

namespace jitstream {

// Shared cancellation flag between the orchestrator and one keep-alive loop.
class HeartbeatHandle {
public:
    HeartbeatHandle();

    void cancel() const noexcept;
    [[nodiscard]] bool cancelled() const noexcept;

private:
    struct State {
        std::atomic<bool> cancelled{false};
    };
    std::shared_ptr<State> state_;
};

struct HeartbeatStart {
    bool ok = false;
    HeartbeatHandle handle;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Connects to the device's keep-alive service and spawns the loop.
class HeartbeatStarter {
public:
    virtual ~HeartbeatStarter() = default;
    [[nodiscard]] virtual HeartbeatStart start(const DeviceId& device) noexcept = 0;
};

// The two messages a session sends about its heartbeat.
class HeartbeatControl {
public:
    virtual ~HeartbeatControl() = default;
    virtual void store(const DeviceId& device, HeartbeatHandle handle) noexcept = 0;
    virtual void kill(const DeviceId& device) noexcept = 0;
};

/*
 * Single-writer actor owning device -> handle. All mutation goes through the
 * mailbox; only the mailbox thread touches the map. A Store for a device
 * that already has a handle cancels the old one before replacing it.
 */
class HeartbeatOrchestrator final : public HeartbeatControl {
public:
    HeartbeatOrchestrator() noexcept = default;
    ~HeartbeatOrchestrator() override;

    HeartbeatOrchestrator(const HeartbeatOrchestrator&) = delete;
    HeartbeatOrchestrator& operator=(const HeartbeatOrchestrator&) = delete;
    HeartbeatOrchestrator(HeartbeatOrchestrator&&) = delete;
    HeartbeatOrchestrator& operator=(HeartbeatOrchestrator&&) = delete;

    [[nodiscard]] bool start();
    // Drains the mailbox, then cancels every remaining handle.
    void stop() noexcept;

    void store(const DeviceId& device, HeartbeatHandle handle) noexcept override;
    void kill(const DeviceId& device) noexcept override;

    // Answered by the mailbox thread after everything posted before them.
    [[nodiscard]] std::size_t sessionCount();
    [[nodiscard]] bool hasSession(const DeviceId& device);
    void flush();

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

private:
    enum class MessageKind : std::uint8_t { Store, Kill, Query, Flush };

    struct Snapshot {
        std::size_t count = 0;
        bool present = false;
    };

    struct Message {
        MessageKind kind = MessageKind::Flush;
        DeviceId device;
        HeartbeatHandle handle;
        std::shared_ptr<std::promise<Snapshot>> reply;
    };

    void run();
    void handle(Message& message);
    [[nodiscard]] bool post(Message message) noexcept;
    [[nodiscard]] Snapshot ask(MessageKind kind, const DeviceId& device);

    std::atomic<bool> running_{false};
    bool shutdown_ = false;   // guarded by mailboxMutex_

    std::mutex mailboxMutex_;
    std::condition_variable mailboxReady_;
    std::deque<Message> mailbox_;

    std::thread thread_;

    // Mailbox thread only
    std::unordered_map<DeviceId, HeartbeatHandle> sessions_;
};

}
