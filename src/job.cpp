/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/job.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mediascribe {

bool canTransition(Status from, Status to) noexcept {
    switch (from) {
        case Status::Queued:
            return to == Status::Stage1Running;
        case Status::Stage1Running:
            return to == Status::Stage2Running || to == Status::Failed;
        case Status::Stage2Running:
            return to == Status::Completed || to == Status::Failed;
        case Status::Completed:
        case Status::Failed:
            return false;
    }
    return false;
}

void transition(Job& job, Status to) {
    if (!canTransition(job.status, to)) {
        throw InternalError(std::string("Illegal job transition ") + toString(job.status) +
                            " -> " + toString(to));
    }
    job.status = to;
    if (isTerminal(to)) {
        job.completedAt = Clock::now();
    }
}

void recordProgress(Job& job, double progress, const std::string& stageLabel, const std::string& message) {
    if (isTerminal(job.status)) {
        throw InternalError(std::string("Progress update on terminal job (") + toString(job.status) + ")");
    }
    progress = std::clamp(progress, 0.0, 100.0);
    job.progress = std::max(job.progress, progress);
    job.stageLabel = stageLabel;
    job.message = message;
}

void markFailed(Job& job, ErrorKind kind, const std::string& detail) {
    transition(job, Status::Failed);
    job.errorKind = kind;
    job.errorDetail = detail;
    job.stageLabel = "Failed";
    job.message = "Error: " + detail;
}

std::string formatTimestamp(Clock::time_point tp) {
    auto time = Clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return ss.str();
}

}
