/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace mediascribe {

struct ToolResult {
    bool ok = false;        // exited normally with status 0
    int exitCode = -1;      // -1 when the process could not be started or was signalled
    std::string output;     // captured stdout (only when requested)
    std::string tail;       // last lines of stderr
    std::string error;      // spawn/wait failure description
};

using LineCallback = std::function<void(const std::string&)>;

// Runs argv[0] (PATH lookup, no shell) and feeds every stderr line to
// onStderrLine as it arrives. Carriage returns also end a line, which is how
// ffmpeg rewrites its status line. stdin is /dev/null.
[[nodiscard]] ToolResult runTool(const std::vector<std::string>& argv,
                                 const LineCallback& onStderrLine,
                                 bool captureStdout = false,
                                 std::size_t tailLines = 8);

}
