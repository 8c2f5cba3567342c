/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/server.hpp"
#include "jitstream/logger.hpp"
#include "jitstream/pool.hpp"
#include <chrono>

namespace jitstream {

namespace {
QueueStoreOptions storeOptions(const Config& config) {
    QueueStoreOptions options;
    options.database = config.database;
    return options;
}

// Per-connection timeout for the device protocols.
constexpr std::chrono::milliseconds kDeviceTimeout{10000};
}

Runtime::Runtime(const Config& config)
    : queues_(storeOptions(config)),
      registry_(config.database, config.pairingDir),
      mux_(config.muxSocket),
      heartbeats_(config.label),
      images_(config.label),
      apps_(config.label),
      tunnels_(config.tunneldUrl),
      remote_(config.label, kDeviceTimeout),
      context_{mux_, heartbeats_, orchestrator_, images_, queues_, tunnels_, remote_, registry_, apps_,
               config.tunnelAttempts, config.tunnelInterval, config.detachCommands, Sleeper()},
      service_(context_) {}

Runtime::~Runtime() {
    stop();
}

bool Runtime::start(std::string& error) {
    if (!queues_.ensureSchema(error)) {
        return false;
    }
    if (!orchestrator_.isRunning() && !orchestrator_.start()) {
        error = "heartbeat orchestrator failed to start";
        return false;
    }
    return true;
}

void Runtime::stop() noexcept {
    orchestrator_.stop();
}

Server::Server(Config config) : config_(std::move(config)) {
    LOG_DEBUG("Server created - database: " + config_.database.string() +
              ", workers: " + std::to_string(config_.workers));
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting jitstream server...");
    setThreadName("Main");

    LOG_DEBUG("Database: " + config_.database.string());
    LOG_DEBUG("Pairing records: " + config_.pairingDir.string());
    LOG_DEBUG("Multiplexer: " + config_.muxSocket);
    LOG_DEBUG("Tunnel directory: " + config_.tunneldUrl);
    LOG_DEBUG("Workers: " + std::to_string(config_.workers));

    try {
        runtime_ = std::make_unique<Runtime>(config_);
        std::string error;
        if (!runtime_->start(error)) {
            LOG_ERROR("Failed to initialise runtime: " + error);
            runtime_.reset();
            return false;
        }

        if (!resetQueues()) {
            runtime_.reset();
            return false;
        }

        pool_ = std::make_unique<Pool>(config_.workers);
        if (!pool_->start([this](const QueueEntry& entry, int) {
                (void)runtime_->service().processClaimed(entry);
            })) {
            LOG_ERROR("Failed to start worker pool");
            pool_.reset();
            runtime_.reset();
            return false;
        }

        shutdown_.store(false);
        running_.store(true);
        scannerThread_ = std::thread(&Server::scanLoop, this);

        LOG_INFO("Server started");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        pool_.reset();
        runtime_.reset();
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down server...");

    shutdown_.store(true);
    running_.store(false);

    if (scannerThread_.joinable()) {
        scannerThread_.join();
    }
    if (pool_) {
        for (const QueueEntry& entry : pool_->stop()) {
            if (runtime_ && !runtime_->queues().fail(QueueKind::Launch, entry.ordinal, "Server shutting down")) {
                LOG_WARN("Could not settle launch entry " + std::to_string(entry.ordinal));
            }
        }
    }
    if (runtime_) {
        runtime_->stop();
    }

    pool_.reset();
    runtime_.reset();

    LOG_INFO("Server shutdown complete");
}

bool Server::resetQueues() noexcept {
    // Queue and heartbeat state does not survive a restart.
    std::string error;
    for (QueueKind kind : {QueueKind::Mount, QueueKind::Launch}) {
        if (!runtime_->queues().clear(kind, error)) {
            LOG_ERROR(std::string("Failed to clear ") + queueKindName(kind) + " queue: " + error);
            return false;
        }
    }
    LOG_DEBUG("Mount and launch queues cleared");
    return true;
}

void Server::scanLoop() {
    ThreadLabel label("Scanner");
    LOG_DEBUG("Scanner loop started");

    while (!shutdown_.load()) {
        int submitted = 0;
        while (!shutdown_.load() && pool_->freeSlots() > 0) {
            auto claim = runtime_->queues().claimNext(QueueKind::Launch);
            if (!claim) {
                LOG_ERROR("Launch queue claim failed: " + claim.error);
                break;
            }
            if (!claim.entry) {
                break;
            }
            if (!pool_->submit(*claim.entry)) {
                if (!runtime_->queues().fail(QueueKind::Launch, claim.entry->ordinal, "Server shutting down")) {
                    LOG_WARN("Could not release launch entry " + std::to_string(claim.entry->ordinal));
                }
                break;
            }
            ++submitted;
        }

        if (submitted > 0) {
            LOG_DEBUG("Submitted " + std::to_string(submitted) + " launch entries to pool");
        }

        auto sleepEnd = std::chrono::steady_clock::now() + config_.scanInterval;
        while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }

    LOG_DEBUG("Scanner loop stopped");
}

}
