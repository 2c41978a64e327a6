/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/progress.hpp"
#include <algorithm>
#include <cmath>
#include <regex>

namespace mediascribe {

namespace {

std::optional<double> parseClock(const std::string& hours, const std::string& minutes, const std::string& seconds) {
    try {
        double value = std::stod(hours) * 3600.0 + std::stod(minutes) * 60.0 + std::stod(seconds);
        if (!std::isfinite(value) || value < 0.0) {
            return std::nullopt;
        }
        return value;
    } catch (...) {
        return std::nullopt;
    }
}

}

std::optional<double> parseProcessedTime(const std::string& line) {
    static const std::regex statusRegex(R"(time=\s*(-?\d+):(\d{2}):(\d{2}(?:\.\d+)?))");
    static const std::regex progressClockRegex(R"(^\s*out_time=(\d+):(\d{2}):(\d{2}(?:\.\d+)?))");
    // ffmpeg reports out_time_ms in microseconds as well
    static const std::regex progressMicrosRegex(R"(^\s*out_time_(?:us|ms)=(-?\d+))");

    std::smatch m;
    if (std::regex_search(line, m, progressMicrosRegex)) {
        try {
            long long micros = std::stoll(m[1].str());
            if (micros < 0) {
                return std::nullopt;
            }
            return static_cast<double>(micros) / 1'000'000.0;
        } catch (...) {
            return std::nullopt;
        }
    }
    if (std::regex_search(line, m, progressClockRegex)) {
        return parseClock(m[1].str(), m[2].str(), m[3].str());
    }
    if (std::regex_search(line, m, statusRegex)) {
        if (!m[1].str().empty() && m[1].str()[0] == '-') {
            return std::nullopt;
        }
        return parseClock(m[1].str(), m[2].str(), m[3].str());
    }
    return std::nullopt;
}

std::optional<double> parseDuration(const std::string& text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return std::nullopt;
    }
    auto end = text.find_first_of(" \t\r\n", start);
    std::string token = text.substr(start, end == std::string::npos ? std::string::npos : end - start);

    try {
        std::size_t used = 0;
        double value = std::stod(token, &used);
        if (used != token.size() || !std::isfinite(value) || value <= 0.0) {
            return std::nullopt;
        }
        return value;
    } catch (...) {
        return std::nullopt;
    }
}

double transcodeProgress(double processedSeconds, std::optional<double> totalSeconds, double previous) noexcept {
    double computed = kIndeterminateProgress;
    if (totalSeconds && *totalSeconds > 0.0) {
        double fraction = std::clamp(processedSeconds / *totalSeconds, 0.0, 1.0);
        computed = kTranscodeBegin + fraction * (kTranscodeEnd - kTranscodeBegin);
    }
    return std::clamp(std::max(previous, computed), kTranscodeBegin, kTranscodeEnd);
}

std::size_t estimateUnits(double durationSeconds, double segmentSeconds) noexcept {
    if (!std::isfinite(durationSeconds) || durationSeconds <= 0.0 || segmentSeconds <= 0.0) {
        return 1;
    }
    auto units = static_cast<std::size_t>(durationSeconds / segmentSeconds);
    return std::max<std::size_t>(units, 1);
}

double transcriptionProgress(std::size_t unitsProcessed, std::size_t estimatedUnits, double previous) noexcept {
    double fraction = estimatedUnits == 0 ? 1.0
        : std::min(static_cast<double>(unitsProcessed) / static_cast<double>(estimatedUnits), 1.0);
    double computed = kTranscribeBegin + fraction * (kTranscribeEnd - kTranscribeBegin);
    return std::clamp(std::max(previous, computed), kTranscribeBegin, kTranscribeEnd);
}

TranscodeTracker::TranscodeTracker(std::optional<double> totalSeconds) noexcept {
    if (totalSeconds && std::isfinite(*totalSeconds) && *totalSeconds > 0.0) {
        total_ = totalSeconds;
    }
}

std::optional<double> TranscodeTracker::onLine(const std::string& line) {
    auto processed = parseProcessedTime(line);
    if (!processed) {
        return std::nullopt;
    }
    processed_ = std::max(processed_, *processed);
    progress_ = transcodeProgress(*processed, total_, progress_);
    return progress_;
}

TranscriptionTracker::TranscriptionTracker(std::size_t estimatedUnits) noexcept
    : estimated_(std::max<std::size_t>(estimatedUnits, 1)) {
}

double TranscriptionTracker::onUnits(int newUnits) noexcept {
    if (newUnits > 0) {
        units_ += static_cast<std::size_t>(newUnits);
    }
    progress_ = transcriptionProgress(units_, estimated_, progress_);
    return progress_;
}

double TranscriptionTracker::finish() noexcept {
    progress_ = kTranscribeEnd;
    return progress_;
}

}
