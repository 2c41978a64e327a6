/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/store.hpp"
#include "mediascribe/logger.hpp"
#include <atomic>
#include <chrono>
#include <sstream>
#include <unistd.h>

namespace mediascribe {

JobSnapshot Store::create(const std::filesystem::path& source,
                          const std::string& fileName,
                          std::uintmax_t fileSize) {
    Job job;
    job.id = generateId();
    job.sourceRef = source;
    job.fileName = fileName.empty() ? source.filename().string() : fileName;
    job.fileSize = fileSize;
    job.createdAt = Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    order_.push_back(job.id);
    auto [it, inserted] = jobs_.emplace(job.id, std::move(job));
    if (!inserted) {
        order_.pop_back();
        throw InternalError("Duplicate job id generated");
    }
    LOG_DEBUG("Job created: " + it->first + " (" + it->second.fileName + ")");
    return it->second;
}

std::optional<JobSnapshot> Store::get(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<JobSnapshot> Store::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobSnapshot> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        out.push_back(jobs_.at(id));
    }
    return out;
}

std::size_t Store::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

std::map<Status, std::size_t> Store::countByStatus() const {
    std::map<Status, std::size_t> counts{
        {Status::Queued, 0}, {Status::Stage1Running, 0}, {Status::Stage2Running, 0},
        {Status::Completed, 0}, {Status::Failed, 0}};

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, job] : jobs_) {
        ++counts[job.status];
    }
    return counts;
}

JobSnapshot Store::mutate(const JobId& id, const std::function<void(Job&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        throw InternalError("Unknown job: " + id);
    }
    // Apply to a copy so a throwing fn leaves the stored job untouched
    Job updated = it->second;
    fn(updated);
    it->second = updated;
    return updated;
}

JobId Store::generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << now << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

}
