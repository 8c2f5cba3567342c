/*
 * jitstream - Wireless JIT enabler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "jitstream/types.hpp"

namespace jitstream {

using EntryProcessor = std::function<void(const QueueEntry&, int workerId)>;

/*
 * Fixed set of worker threads running claimed queue entries. Each entry
 * occupies one worker for its whole session; the scanner asks freeSlots()
 * before claiming more so nothing sits claimed in memory for long.
 */
class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(EntryProcessor processor);

    // Joins the workers. Entries no worker picked up are handed back so the
    // caller can settle them in the store.
    std::vector<QueueEntry> stop() noexcept;

    [[nodiscard]] bool submit(QueueEntry entry) noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t pending() const noexcept;
    [[nodiscard]] int busyWorkers() const noexcept { return busy_.load(); }
    [[nodiscard]] int workerCount() const noexcept { return workers_; }
    [[nodiscard]] int freeSlots() const noexcept;

private:
    [[nodiscard]] std::optional<QueueEntry> next();
    void workerLoop(int workerId);

    int workers_;
    EntryProcessor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<int> busy_{0};

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<QueueEntry> pending_;

    std::vector<std::thread> threads_;
};

}
