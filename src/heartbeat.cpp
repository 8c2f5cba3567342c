/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/heartbeat.hpp"
#include "jitstream/logger.hpp"

namespace jitstream {

HeartbeatHandle::HeartbeatHandle() : state_(std::make_shared<State>()) {}

void HeartbeatHandle::cancel() const noexcept {
    state_->cancelled.store(true);
}

bool HeartbeatHandle::cancelled() const noexcept {
    return state_->cancelled.load();
}

HeartbeatOrchestrator::~HeartbeatOrchestrator() {
    stop();
}

bool HeartbeatOrchestrator::start() {
    if (running_.load()) {
        LOG_WARN("Heartbeat orchestrator already running");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mailboxMutex_);
        shutdown_ = false;
    }

    running_.store(true);
    try {
        thread_ = std::thread(&HeartbeatOrchestrator::run, this);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start heartbeat orchestrator: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
    return true;
}

void HeartbeatOrchestrator::stop() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mailboxMutex_);
        shutdown_ = true;
    }
    mailboxReady_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_DEBUG("Heartbeat orchestrator stopped");
}

void HeartbeatOrchestrator::store(const DeviceId& device, HeartbeatHandle handle) noexcept {
    Message message;
    message.kind = MessageKind::Store;
    message.device = device;
    message.handle = handle;
    if (!post(std::move(message))) {
        // Nobody will ever own this loop
        handle.cancel();
    }
}

void HeartbeatOrchestrator::kill(const DeviceId& device) noexcept {
    Message message;
    message.kind = MessageKind::Kill;
    message.device = device;
    if (!post(std::move(message))) {
        LOG_DEBUG("Kill for " + device + " dropped, orchestrator not running");
    }
}

std::size_t HeartbeatOrchestrator::sessionCount() {
    return ask(MessageKind::Query, {}).count;
}

bool HeartbeatOrchestrator::hasSession(const DeviceId& device) {
    return ask(MessageKind::Query, device).present;
}

void HeartbeatOrchestrator::flush() {
    (void)ask(MessageKind::Flush, {});
}

bool HeartbeatOrchestrator::post(Message message) noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(mailboxMutex_);
            if (!running_.load() || shutdown_) {
                return false;
            }
            mailbox_.push_back(std::move(message));
        }
        mailboxReady_.notify_one();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to post heartbeat message: " + std::string(e.what()));
        return false;
    }
}

HeartbeatOrchestrator::Snapshot HeartbeatOrchestrator::ask(MessageKind kind, const DeviceId& device) {
    Message message;
    message.kind = kind;
    message.device = device;
    message.reply = std::make_shared<std::promise<Snapshot>>();
    auto answer = message.reply->get_future();
    if (!post(std::move(message))) {
        return {};
    }
    return answer.get();
}

void HeartbeatOrchestrator::run() {
    ThreadLabel label("Heartbeat");
    LOG_DEBUG("Heartbeat orchestrator started");

    while (true) {
        std::deque<Message> batch;
        {
            std::unique_lock<std::mutex> lock(mailboxMutex_);
            mailboxReady_.wait(lock, [this] { return !mailbox_.empty() || shutdown_; });
            batch.swap(mailbox_);
            if (batch.empty() && shutdown_) {
                break;
            }
        }

        for (auto& message : batch) {
            handle(message);
        }
    }

    for (auto& entry : sessions_) {
        entry.second.cancel();
    }
    if (!sessions_.empty()) {
        LOG_INFO("Cancelled " + std::to_string(sessions_.size()) + " heartbeat(s) on shutdown");
    }
    sessions_.clear();
}

void HeartbeatOrchestrator::handle(Message& message) {
    switch (message.kind) {
        case MessageKind::Store: {
            auto it = sessions_.find(message.device);
            if (it != sessions_.end()) {
                // The old loop may already have exited; cancelling is harmless.
                it->second.cancel();
                it->second = message.handle;
                LOG_DEBUG("Heartbeat for " + message.device + " superseded");
            } else {
                sessions_.emplace(message.device, message.handle);
                LOG_DEBUG("Heartbeat stored for " + message.device);
            }
            break;
        }
        case MessageKind::Kill: {
            auto it = sessions_.find(message.device);
            if (it == sessions_.end()) {
                break;
            }
            it->second.cancel();
            sessions_.erase(it);
            LOG_DEBUG("Heartbeat killed for " + message.device);
            break;
        }
        case MessageKind::Query:
        case MessageKind::Flush: {
            Snapshot snapshot;
            snapshot.count = sessions_.size();
            snapshot.present = !message.device.empty() && sessions_.count(message.device) > 0;
            if (message.reply) {
                message.reply->set_value(snapshot);
            }
            break;
        }
    }
}

}
