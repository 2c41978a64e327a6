/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "mediascribe/text_format.hpp"

using namespace mediascribe;

int main() {
    std::cout << "[Test] Pauses choose the separator..." << std::endl;
    {
        std::vector<Segment> segments = {
            {" Hello there.", 0.0, 1.0},
            {" How are you?", 1.3, 2.0},    // 0.3s: space
            {" Fine.", 3.0, 3.5},            // 1.0s: line break
            {" Next topic.", 6.0, 7.0},      // 2.5s: paragraph
        };
        std::string out = formatSegments(segments);
        assert(out == "Hello there. How are you?\nFine.\n\nNext topic.");
    }

    std::cout << "[Test] Threshold edges and overlaps..." << std::endl;
    {
        std::vector<Segment> segments = {
            {"a", 0.0, 1.0},
            {"b", 1.5, 2.0},    // exactly 0.5s: line break
            {"c", 3.5, 4.0},    // exactly 1.5s: paragraph
            {"d", 3.8, 5.0},    // overlap: space
        };
        assert(formatSegments(segments) == "a\nb\n\nc d");

        PauseThresholds wide;
        wide.shortPause = 2.0;
        wide.mediumPause = 4.0;
        assert(formatSegments(segments, wide) == "a b c d");
    }

    std::cout << "[Test] Empty segments are skipped..." << std::endl;
    {
        std::vector<Segment> segments = {
            {"   ", 0.0, 0.5},
            {"first", 1.0, 2.0},
            {"", 2.1, 5.0},
            {"second", 2.2, 3.0},  // pause measured from "first"
        };
        assert(formatSegments(segments) == "first second");
        assert(formatSegments({}).empty());
        std::vector<Segment> blank = {{" \n ", 0.0, 1.0}};
        assert(formatSegments(blank).empty());
    }

    std::cout << "[Test] Text formatting tests passed." << std::endl;
    return 0;
}
