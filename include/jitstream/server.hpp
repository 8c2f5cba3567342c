/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "jitstream/config.hpp"
#include "jitstream/heartbeat.hpp"
#include "jitstream/identity.hpp"
#include "jitstream/lockdown.hpp"
#include "jitstream/mux.hpp"
#include "jitstream/queue_store.hpp"
#include "jitstream/remote_services.hpp"
#include "jitstream/service.hpp"
#include "jitstream/session.hpp"
#include "jitstream/tunnel.hpp"

namespace jitstream {

class Pool;

// The concrete device stack for one Config, wired into a JitService.
class Runtime final {
public:
    explicit Runtime(const Config& config);
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;
    Runtime(Runtime&&) = delete;
    Runtime& operator=(Runtime&&) = delete;

    [[nodiscard]] bool start(std::string& error);
    void stop() noexcept;

    [[nodiscard]] QueueStore& queues() noexcept { return queues_; }
    [[nodiscard]] DeviceRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] HeartbeatOrchestrator& orchestrator() noexcept { return orchestrator_; }
    [[nodiscard]] JitService& service() noexcept { return service_; }

private:
    QueueStore queues_;
    DeviceRegistry registry_;
    HeartbeatOrchestrator orchestrator_;
    UsbmuxRegistrar mux_;
    LockdownHeartbeat heartbeats_;
    LockdownImageProbe images_;
    LockdownAppCatalog apps_;
    TunneldDirectory tunnels_;
    TunnelRemoteServices remote_;
    SessionContext context_;
    JitService service_;
};

/*
 * Daemon: resets both queues, then drains the launch queue. A scan thread
 * claims pending entries one at a time while a worker is free and hands them
 * to the pool; each worker runs the session and records the outcome.
 */
class Server final {
public:
    explicit Server(Config config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    [[nodiscard]] bool resetQueues() noexcept;
    void scanLoop();

    Config config_;
    std::unique_ptr<Runtime> runtime_;
    std::unique_ptr<Pool> pool_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    std::thread scannerThread_;
};

}
