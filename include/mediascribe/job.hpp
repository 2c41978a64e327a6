/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "mediascribe/types.hpp"

namespace mediascribe {

using Clock = std::chrono::system_clock;

struct Job {
    JobId id;

    std::filesystem::path sourceRef;
    std::filesystem::path intermediateRef;  // set once transcoding succeeded
    std::filesystem::path resultRef;        // set once transcription succeeded

    std::string fileName;
    std::uintmax_t fileSize = 0;

    Status status = Status::Queued;
    double progress = 0.0;
    std::string stageLabel = "Queued";
    std::string message;

    Clock::time_point createdAt{};
    std::optional<Clock::time_point> completedAt;

    ErrorKind errorKind = ErrorKind::None;
    std::string errorDetail;
};

// Immutable copy handed to readers and observers.
using JobSnapshot = Job;

[[nodiscard]] bool canTransition(Status from, Status to) noexcept;

// Moves the job along the state machine. Throws InternalError on an illegal
// transition. Entering a terminal state stamps completedAt.
void transition(Job& job, Status to);

// Records a progress event. The value is clamped to [0,100] and never lowers
// the job's progress. Throws InternalError when the job is terminal.
void recordProgress(Job& job, double progress, const std::string& stageLabel, const std::string& message);

// Failed transition with the already redacted detail.
void markFailed(Job& job, ErrorKind kind, const std::string& detail);

[[nodiscard]] std::string formatTimestamp(Clock::time_point tp);

}
