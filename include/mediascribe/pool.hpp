/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "mediascribe/types.hpp"

namespace mediascribe {

using JobProcessor = std::function<void(const JobId&, int workerId)>;

// Fixed set of worker threads sharing one unbounded FIFO queue. A worker runs
// one job to completion before taking the next.
class Pool {
public:
    static constexpr int kDefaultWorkers = 2;

    explicit Pool(int workers = kDefaultWorkers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobProcessor processor);

    // Stops accepting jobs and joins the workers after their current job.
    // Jobs still waiting in the queue are dropped.
    void stop() noexcept;

    // False once the pool has been stopped (or was never started).
    [[nodiscard]] bool submit(const JobId& jobId) noexcept;

    // Waits until the queue is empty and no worker is busy.
    bool waitIdle(std::chrono::milliseconds timeout) const;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int activeCount() const noexcept { return active_.load(); }
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);
    
    int workers_;
    JobProcessor processor_;
    
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<int> active_{0};
    
    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    mutable std::condition_variable idle_;
    std::queue<JobId> jobQueue_;
    
    std::vector<std::thread> workerThreads_;
};

}
