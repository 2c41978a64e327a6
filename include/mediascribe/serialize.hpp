/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "mediascribe/flow.hpp"
#include "mediascribe/job.hpp"

namespace mediascribe {

using json = nlohmann::ordered_json;

// Public view of a job. Internal paths never leave the process.
[[nodiscard]] json toJson(const JobSnapshot& job);
[[nodiscard]] json toJson(const StatusReport& report);

// Single line, invalid UTF-8 replaced.
[[nodiscard]] std::string dumpLine(const json& value);

}
