/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <functional>
#include <string>

#include "mediascribe/hub.hpp"
#include "mediascribe/store.hpp"
#include "mediascribe/transcode.hpp"
#include "mediascribe/transcribe.hpp"

namespace mediascribe {

enum class ProcessResult : uint8_t {
    Success,
    Failed,
    NotFound,
    SystemError
};

struct Workspace {
    std::filesystem::path uploads;
    std::filesystem::path audio;
    std::filesystem::path transcripts;

    // <root>/uploads, <root>/audio, <root>/transcripts
    [[nodiscard]] static Workspace under(const std::filesystem::path& root);

    // Creates the directories. Throws std::filesystem::filesystem_error.
    void create() const;
};

// Runs one job through both stages. Every state change goes through the
// Store and is then published on the Hub.
class Processor {
public:
    Processor(Store& store, Hub& hub, TranscodeTool& transcoder, SpeechModel& model,
              Workspace workspace, double segmentSeconds = kDefaultSegmentSeconds);

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    // Always leaves the job terminal (unless it was not claimable).
    [[nodiscard]] ProcessResult process(const JobId& jobId, int workerId) noexcept;

private:
    void update(const JobId& jobId, const std::function<void(Job&)>& fn);
    [[nodiscard]] bool claim(const JobId& jobId) noexcept;
    ProcessResult fail(const JobId& jobId, ErrorKind kind, const std::string& detail) noexcept;

    Store& store_;
    Hub& hub_;
    TranscodeStage transcode_;
    TranscribeStage transcribe_;
    Workspace workspace_;
};

}
