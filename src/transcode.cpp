/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/transcode.hpp"
#include "mediascribe/logger.hpp"
#include "mediascribe/progress.hpp"
#include "mediascribe/types.hpp"
#include <cstdio>

namespace mediascribe {

namespace {

std::string percentMessage(const char* prefix, double stageFraction) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s: %.1f%%", prefix, stageFraction * 100.0);
    return buf;
}

}

FfmpegTool::FfmpegTool(std::string ffmpegPath, std::string ffprobePath)
    : ffmpeg_(std::move(ffmpegPath)), ffprobe_(std::move(ffprobePath)) {
}

std::optional<double> FfmpegTool::probeDuration(const std::filesystem::path& source) {
    ToolResult r = runTool({ffprobe_, "-v", "error",
                            "-show_entries", "format=duration",
                            "-of", "default=noprint_wrappers=1:nokey=1",
                            source.string()},
                           nullptr, true);
    if (!r.ok) {
        LOG_WARN("ffprobe failed (exit " + std::to_string(r.exitCode) + "): " +
                 (r.error.empty() ? r.tail : r.error));
        return std::nullopt;
    }
    auto duration = parseDuration(r.output);
    if (!duration) {
        LOG_WARN("ffprobe returned no usable duration for " + source.filename().string());
    }
    return duration;
}

ToolResult FfmpegTool::convert(const std::filesystem::path& source,
                               const std::filesystem::path& target,
                               const LineCallback& onLine) {
    return runTool({ffmpeg_, "-hide_banner", "-nostdin",
                    "-i", source.string(),
                    "-vn",
                    "-acodec", "pcm_s16le",
                    "-ar", "16000",
                    "-ac", "1",
                    "-y", target.string()},
                   onLine);
}

void TranscodeStage::run(const std::filesystem::path& source,
                         const std::filesystem::path& target,
                         const ProgressSink& sink) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        throw TranscodeError("Source media is not readable: " + source.string());
    }

    sink(kTranscodeBegin, "Probing media duration...");
    auto duration = tool_.probeDuration(source);
    TranscodeTracker tracker(duration);
    if (tracker.indeterminate()) {
        LOG_INFO("Duration unknown for " + source.filename().string() + ", reporting indeterminate progress");
    } else {
        LOG_DEBUG("Media duration: " + std::to_string(*duration) + "s");
    }

    std::filesystem::create_directories(target.parent_path(), ec);
    std::filesystem::remove(target, ec);

    ToolResult result = tool_.convert(source, target, [&](const std::string& line) {
        LOG_TRACE("[ffmpeg] " + line);
        auto progress = tracker.onLine(line);
        if (!progress) {
            return;
        }
        if (tracker.indeterminate()) {
            sink(*progress, "Extracting audio...");
        } else {
            sink(*progress, percentMessage("Extracting audio", *progress / kTranscodeEnd));
        }
    });

    if (!result.ok) {
        std::string reason = !result.error.empty() ? result.error
                           : "transcoder exited with status " + std::to_string(result.exitCode);
        throw TranscodeError("Audio extraction failed: " + reason, result.tail);
    }

    auto size = std::filesystem::file_size(target, ec);
    if (ec || size == 0) {
        throw TranscodeError("Audio extraction produced no output", result.tail);
    }

    sink(kTranscodeEnd, "Audio extraction complete");
    LOG_DEBUG("Audio extracted: " + target.filename().string() + " (" + std::to_string(size) + " bytes)");
}

}
