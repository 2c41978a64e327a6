/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "mediascribe/hub.hpp"
#include "mediascribe/pool.hpp"
#include "mediascribe/processor.hpp"
#include "mediascribe/store.hpp"

namespace mediascribe {

enum class SubmissionError : uint8_t {
    None = 0,
    IoError,
    InvalidContent,
    Unavailable
};

struct SubmitResult {
    bool ok = false;
    std::optional<JobSnapshot> job;
    SubmissionError error = SubmissionError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Submission side: validates a source file, stages it into the uploads
// directory, creates the Queued job, publishes it and enqueues it.
// Nothing is created when validation or staging fails.
class Work final {
public:
    Work(Store& store, Hub& hub, Pool& pool, Workspace workspace) noexcept;

    Work(const Work&) = delete;
    Work& operator=(const Work&) = delete;
    Work(Work&&) = delete;
    Work& operator=(Work&&) = delete;

    // fileName defaults to the source's file name.
    [[nodiscard]] SubmitResult submit(const std::filesystem::path& source, std::string fileName = {});

private:
    [[nodiscard]] bool stageSource(const std::filesystem::path& source,
                                   const std::filesystem::path& dest) const noexcept;
    [[nodiscard]] static std::string stagedName(const std::string& fileName);

    Store& store_;
    Hub& hub_;
    Pool& pool_;
    Workspace workspace_;
};

}
