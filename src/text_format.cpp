/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/text_format.hpp"

namespace mediascribe {

namespace {

std::string trimmed(const std::string& text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

const char* separatorFor(double pause, const PauseThresholds& thresholds) noexcept {
    if (pause < thresholds.shortPause) {
        return " ";
    }
    if (pause < thresholds.mediumPause) {
        return "\n";
    }
    return "\n\n";
}

}

std::string formatSegments(const std::vector<Segment>& segments, const PauseThresholds& thresholds) {
    std::string out;
    bool first = true;
    double previousEnd = 0.0;

    for (const auto& segment : segments) {
        std::string text = trimmed(segment.text);
        if (text.empty()) {
            continue;
        }
        if (!first) {
            // Overlapping or touching segments give a negative or zero pause
            out += separatorFor(segment.start - previousEnd, thresholds);
        }
        out += text;
        previousEnd = segment.end;
        first = false;
    }
    return out;
}

}
