/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace mediascribe {

// Overall progress budget of each stage
constexpr double kTranscodeBegin = 0.0;
constexpr double kTranscodeEnd = 50.0;
constexpr double kTranscribeBegin = 50.0;
constexpr double kTranscribeEnd = 100.0;

// Reported for every transcode event when the source duration is unknown
constexpr double kIndeterminateProgress = (kTranscodeBegin + kTranscodeEnd) / 2.0;

constexpr double kDefaultSegmentSeconds = 5.0;

// Extracts the processed media time, in seconds, from one line of ffmpeg
// output. Understands the stderr status line (time=HH:MM:SS.cc) and the
// -progress key/value form (out_time_us=, out_time_ms=, out_time=).
[[nodiscard]] std::optional<double> parseProcessedTime(const std::string& line);

// Parses ffprobe's "format=duration" output. Empty, N/A or non-positive
// values yield nullopt.
[[nodiscard]] std::optional<double> parseDuration(const std::string& text);

[[nodiscard]] double transcodeProgress(double processedSeconds,
                                       std::optional<double> totalSeconds,
                                       double previous) noexcept;

[[nodiscard]] std::size_t estimateUnits(double durationSeconds,
                                        double segmentSeconds = kDefaultSegmentSeconds) noexcept;

[[nodiscard]] double transcriptionProgress(std::size_t unitsProcessed,
                                           std::size_t estimatedUnits,
                                           double previous) noexcept;

// Stateful wrapper around transcodeProgress for one stage run.
class TranscodeTracker {
public:
    explicit TranscodeTracker(std::optional<double> totalSeconds) noexcept;

    // Returns the new progress when the line carried a time signal.
    std::optional<double> onLine(const std::string& line);

    [[nodiscard]] double progress() const noexcept { return progress_; }
    [[nodiscard]] bool indeterminate() const noexcept { return !total_.has_value(); }
    [[nodiscard]] double processedSeconds() const noexcept { return processed_; }

private:
    std::optional<double> total_;
    double processed_ = 0.0;
    double progress_ = kTranscodeBegin;
};

// Stateful wrapper around transcriptionProgress for one stage run.
class TranscriptionTracker {
public:
    explicit TranscriptionTracker(std::size_t estimatedUnits) noexcept;

    double onUnits(int newUnits) noexcept;
    double finish() noexcept;

    [[nodiscard]] double progress() const noexcept { return progress_; }
    [[nodiscard]] std::size_t units() const noexcept { return units_; }
    [[nodiscard]] std::size_t estimated() const noexcept { return estimated_; }

private:
    std::size_t estimated_;
    std::size_t units_ = 0;
    double progress_ = kTranscribeBegin;
};

}
