/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/flow.hpp"
#include "mediascribe/logger.hpp"
#include <fstream>
#include <iterator>

namespace mediascribe {

Flow::Flow(const Store& store, const Pool& pool) noexcept
    : store_(store), pool_(pool) {}

std::optional<JobSnapshot> Flow::get(const JobId& id) const noexcept {
    try {
        return store_.get(id);
    } catch (const std::exception& e) {
        LOG_ERROR("Error retrieving job " + id + ": " + e.what());
        return std::nullopt;
    }
}

std::vector<JobSnapshot> Flow::list(std::size_t max) const noexcept {
    std::vector<JobSnapshot> jobs;
    try {
        jobs = store_.list();
        if (max > 0 && jobs.size() > max) {
            jobs.erase(jobs.begin(), jobs.end() - static_cast<std::ptrdiff_t>(max));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing jobs: " + std::string(e.what()));
    }
    return jobs;
}

std::optional<std::string> Flow::result(const JobId& id) const {
    auto job = get(id);
    if (!job || job->status != Status::Completed || job->resultRef.empty()) {
        return std::nullopt;
    }

    std::ifstream file(job->resultRef, std::ios::binary);
    if (!file) {
        LOG_WARN("Result artifact missing for completed job: " + id);
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

StatusReport Flow::status() const noexcept {
    StatusReport report;
    report.workers = pool_.workerCount();
    report.active = pool_.activeCount();
    report.queueSize = pool_.queueSize();
    try {
        report.counts = store_.countByStatus();
        for (const auto& [status, n] : report.counts) {
            report.totalJobs += n;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error counting jobs: " + std::string(e.what()));
    }
    return report;
}

}
