/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

namespace mediascribe {

struct Config {
    int workers = 2;
    std::string modelPath = "models/ggml-base.bin";
    std::filesystem::path storage = "./storage";

    std::string host = "127.0.0.1";
    int httpPort = 8000;
    int livePort = 8001;
    bool serveNetwork = true;        // off: pipeline only, no listeners

    std::string ffmpeg = "ffmpeg";
    std::string ffprobe = "ffprobe";

    bool useGpu = true;
    int threads = 0;                 // 0: hardware threads / workers
    std::string language = "auto";

    double segmentSeconds = 5.0;
    int heartbeatSeconds = 30;

    // Defaults overridden by MEDIASCRIBE_* environment variables.
    [[nodiscard]] static Config fromEnv();

    // Threads per whisper decode after resolving the 0 default.
    [[nodiscard]] int decodeThreads() const noexcept;

    // Empty when valid, otherwise a description of the first problem.
    [[nodiscard]] std::string validate() const;
};

}
