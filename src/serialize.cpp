/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/serialize.hpp"
#include <cmath>

namespace mediascribe {

json toJson(const JobSnapshot& job) {
    json j;
    j["id"] = job.id;
    j["status"] = toString(job.status);
    j["progress"] = std::round(job.progress * 10.0) / 10.0;
    j["stage"] = job.stageLabel;
    j["message"] = job.message;
    j["file_name"] = job.fileName;
    j["file_size"] = job.fileSize;
    j["created_at"] = formatTimestamp(job.createdAt);
    if (job.completedAt) {
        j["completed_at"] = formatTimestamp(*job.completedAt);
    }
    if (job.status == Status::Failed) {
        j["error"] = job.errorDetail;
        j["error_kind"] = toString(job.errorKind);
    }
    return j;
}

json toJson(const StatusReport& report) {
    json counts = json::object();
    for (const auto& [status, n] : report.counts) {
        counts[toString(status)] = n;
    }

    json j;
    j["workers"] = report.workers;
    j["active"] = report.active;
    j["queue_size"] = report.queueSize;
    j["total_jobs"] = report.totalJobs;
    j["jobs"] = counts;
    return j;
}

std::string dumpLine(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

}
