/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "mediascribe/subprocess.hpp"

namespace mediascribe {

// (overall progress, human readable detail)
using ProgressSink = std::function<void(double, const std::string&)>;

// The external transcoder, seen as a black box that emits text lines.
class TranscodeTool {
public:
    virtual ~TranscodeTool() = default;

    // Total media duration in seconds, nullopt when it cannot be determined.
    [[nodiscard]] virtual std::optional<double> probeDuration(const std::filesystem::path& source) = 0;

    // Converts source into 16 kHz mono PCM WAV at target.
    [[nodiscard]] virtual ToolResult convert(const std::filesystem::path& source,
                                             const std::filesystem::path& target,
                                             const LineCallback& onLine) = 0;
};

class FfmpegTool final : public TranscodeTool {
public:
    FfmpegTool(std::string ffmpegPath = "ffmpeg", std::string ffprobePath = "ffprobe");

    [[nodiscard]] std::optional<double> probeDuration(const std::filesystem::path& source) override;
    [[nodiscard]] ToolResult convert(const std::filesystem::path& source,
                                     const std::filesystem::path& target,
                                     const LineCallback& onLine) override;

private:
    std::string ffmpeg_;
    std::string ffprobe_;
};

// Stage 1: runs the transcoder and maps its output onto [0, 50].
class TranscodeStage {
public:
    explicit TranscodeStage(TranscodeTool& tool) noexcept : tool_(tool) {}

    // Throws TranscodeError. On return target exists and is non-empty.
    void run(const std::filesystem::path& source,
             const std::filesystem::path& target,
             const ProgressSink& sink);

private:
    TranscodeTool& tool_;
};

}
