/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <vector>

namespace mediascribe {

// One decoded stretch of speech, times in seconds from the start of the audio.
struct Segment {
    std::string text;
    double start = 0.0;
    double end = 0.0;
};

// Pauses shorter than shortPause join segments with a space, shorter than
// mediumPause with a line break, anything longer starts a new paragraph.
struct PauseThresholds {
    double shortPause = 0.5;
    double mediumPause = 1.5;
};

// Joins segment texts, separated according to the silence between them.
// Segments that are empty after trimming are skipped; the result is trimmed.
[[nodiscard]] std::string formatSegments(const std::vector<Segment>& segments,
                                         const PauseThresholds& thresholds = {});

}
