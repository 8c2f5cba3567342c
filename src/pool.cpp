/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jitstream/pool.hpp"
#include "jitstream/logger.hpp"
#include <iterator>
#include <string>

namespace jitstream {

namespace {
std::string describe(const QueueEntry& entry) {
    return std::string(queueKindName(entry.kind)) + " entry " + std::to_string(entry.ordinal) +
           (entry.deviceId.empty() ? "" : " for " + entry.deviceId);
}

// Holds one busy count for the length of a session.
class BusyScope {
public:
    explicit BusyScope(std::atomic<int>& busy) noexcept : busy_(busy) {}
    ~BusyScope() { busy_.fetch_sub(1); }

    BusyScope(const BusyScope&) = delete;
    BusyScope& operator=(const BusyScope&) = delete;

private:
    std::atomic<int>& busy_;
};
}

Pool::Pool(int workers) noexcept : workers_(workers > 0 ? workers : 1) {}

Pool::~Pool() {
    stop();
}

bool Pool::start(EntryProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }
    if (!processor) {
        LOG_ERROR("Pool needs an entry processor");
        return false;
    }

    processor_ = std::move(processor);
    shutdown_.store(false);
    running_.store(true);

    try {
        threads_.reserve(static_cast<std::size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            threads_.emplace_back(&Pool::workerLoop, this, i);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Could not spawn worker threads: " + std::string(e.what()));
        stop();
        return false;
    }

    LOG_INFO("Pool started with " + std::to_string(workers_) + " workers");
    return true;
}

std::vector<QueueEntry> Pool::stop() noexcept {
    std::vector<QueueEntry> unstarted;
    if (!running_.load()) {
        return unstarted;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    wake_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        unstarted.assign(std::make_move_iterator(pending_.begin()), std::make_move_iterator(pending_.end()));
        pending_.clear();
    }
    if (!unstarted.empty()) {
        LOG_WARN(std::to_string(unstarted.size()) + " entries never reached a worker");
    }
    LOG_DEBUG("Pool stopped");
    return unstarted;
}

bool Pool::submit(QueueEntry entry) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Pool stopped; refusing " + describe(entry));
        return false;
    }

    try {
        std::string label = describe(entry);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.push_back(std::move(entry));
        }
        wake_.notify_one();
        LOG_TRACE("Queued " + label);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Could not queue entry: " + std::string(e.what()));
        return false;
    }
}

std::size_t Pool::pending() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

int Pool::freeSlots() const noexcept {
    int used = busyWorkers() + static_cast<int>(pending());
    return used < workers_ ? workers_ - used : 0;
}

std::optional<QueueEntry> Pool::next() {
    std::unique_lock<std::mutex> lock(mutex_);
    wake_.wait(lock, [this] { return !pending_.empty() || shutdown_.load(); });
    if (shutdown_.load()) {
        return std::nullopt;
    }
    QueueEntry entry = std::move(pending_.front());
    pending_.pop_front();
    // Counted before the lock drops so freeSlots() never sees the entry twice or not at all.
    busy_.fetch_add(1);
    return entry;
}

void Pool::workerLoop(int workerId) {
    ThreadLabel label("Worker-" + std::to_string(workerId));

    try {
        while (auto entry = next()) {
            BusyScope busy(busy_);
            LOG_INFO("Running " + describe(*entry));
            try {
                processor_(*entry, workerId);
            } catch (const std::exception& e) {
                LOG_ERROR(describe(*entry) + " threw: " + e.what());
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Worker exiting on error: " + std::string(e.what()));
    }
}

}
