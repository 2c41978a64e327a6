/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <cassert>
#include <iostream>
#include <string>

#include "mediascribe/types.hpp"

using namespace mediascribe;

int main() {
    std::cout << "[Test] Absolute and relative paths are hidden..." << std::endl;
    {
        std::string out = redact("/home/user/storage/uploads/a.mp4: Invalid data found when processing input");
        assert(out == "<path>: Invalid data found when processing input");

        out = redact("Error opening input file 'storage/uploads/x.mkv'.");
        assert(out.find("storage") == std::string::npos);
        assert(out.find("<path>") != std::string::npos);

        out = redact("cannot write ./audio/1.wav");
        assert(out == "cannot write <path>");

        out = redact("model=/opt/models/ggml-base.bin failed");
        assert(out == "model=<path> failed");
    }

    std::cout << "[Test] Paths containing spaces are hidden whole..." << std::endl;
    {
        std::string out = redact("Source media is not readable: /srv/media/My Review 2025.mp4");
        assert(out == "Source media is not readable: <path>");

        out = redact("'/srv/media/Team Call (final).mkv': No such file or directory");
        assert(out == "'<path>': No such file or directory");
        assert(out.find("final") == std::string::npos);

        out = redact("cannot open /srv/My Folder/clip.wav for reading");
        assert(out == "cannot open <path> for reading");

        // a path never swallows the next line
        out = redact("Error opening /srv/incoming\nConversion failed!");
        assert(out == "Error opening <path> Conversion failed!");
    }

    std::cout << "[Test] Ordinary text survives..." << std::endl;
    {
        std::string out = redact("Audio extraction failed: transcoder exited with status 1");
        assert(out == "Audio extraction failed: transcoder exited with status 1");

        out = redact("Stream #0:1: Audio: aac (LC), 44100 Hz, stereo");
        assert(out == "Stream #0:1: Audio: aac (LC), 44100 Hz, stereo");
    }

    std::cout << "[Test] Whitespace collapses and length is capped..." << std::endl;
    {
        std::string out = redact("first line\n  second\r\nthird   ");
        assert(out == "first line second third");

        std::string longText(2000, 'x');
        out = redact(longText);
        assert(out.size() == 512);
        assert(out.substr(509) == "...");

        out = redact(longText, 20);
        assert(out.size() == 20);
    }

    std::cout << "[Test] Redaction tests passed." << std::endl;
    return 0;
}
