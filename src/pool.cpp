/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/pool.hpp"
#include "mediascribe/logger.hpp"

namespace mediascribe {

Pool::Pool(int workers) noexcept : workers_(workers > 0 ? workers : kDefaultWorkers) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(JobProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid job processor provided");
        return false;
    }

    processor_ = std::move(processor);
    shutdown_.store(false);
    running_.store(true);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        
        LOG_INFO("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");
    
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    
    jobAvailable_.notify_all();
    
    // Workers finish the job in hand before they observe shutdown
    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    
    workerThreads_.clear();
    
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        while (!jobQueue_.empty()) {
            LOG_WARN("Dropping queued job at shutdown: " + jobQueue_.front());
            jobQueue_.pop();
            ++dropped;
        }
    }
    idle_.notify_all();
    
    LOG_INFO("Pool stopped" + (dropped ? " (" + std::to_string(dropped) + " queued jobs dropped)" : std::string()));
}

bool Pool::submit(const JobId& jobId) noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!running_.load() || shutdown_.load()) {
                LOG_DEBUG("Cannot submit job to stopped pool: " + jobId);
                return false;
            }
            jobQueue_.push(jobId);
        }
        
        jobAvailable_.notify_one();
        LOG_DEBUG("Job queued: " + jobId);
        return true;
    } catch (...) {
        LOG_ERROR("Failed to queue job: " + jobId);
        return false;
    }
}

bool Pool::waitIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(queueMutex_);
    return idle_.wait_for(lock, timeout, [this] {
        return (jobQueue_.empty() && active_.load() == 0) || !running_.load();
    });
}

std::size_t Pool::queueSize() const noexcept {
    try {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return jobQueue_.size();
    } catch (...) {
        return 0;
    }
}

void Pool::workerLoop(int workerId) {
    setThreadName(getThreadName(workerId));
    LOG_DEBUG("Worker-" + std::to_string(workerId) + " thread started");
    
    try {
        while (true) {
            JobId jobId;
            
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                
                jobAvailable_.wait(lock, [this] { 
                    return !jobQueue_.empty() || shutdown_.load(); 
                });
                
                if (shutdown_.load()) {
                    break;
                }
                
                jobId = jobQueue_.front();
                jobQueue_.pop();
                // Counted busy before the lock drops so waitIdle never sees a gap
                active_.fetch_add(1);
            }
            
            LOG_INFO("Worker-" + std::to_string(workerId) + " claimed job: " + jobId);
            
            try {
                processor_(jobId, workerId);
            } catch (const std::exception& e) {
                LOG_ERROR("Worker " + std::to_string(workerId) + " job processing error: " + 
                         std::string(e.what()) + " (job: " + jobId + ")");
            } catch (...) {
                LOG_ERROR("Worker " + std::to_string(workerId) + " unknown job processing error (job: " + jobId + ")");
            }

            {
                std::lock_guard<std::mutex> lock(queueMutex_);
                active_.fetch_sub(1);
            }
            idle_.notify_all();
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Worker " + std::to_string(workerId) + " fatal error: " + std::string(e.what()));
    }
    
    LOG_DEBUG("Worker " + std::to_string(workerId) + " stopped");
}

}
