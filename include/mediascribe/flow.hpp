/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "mediascribe/pool.hpp"
#include "mediascribe/store.hpp"

namespace mediascribe {

struct StatusReport {
    int workers = 0;
    int active = 0;
    std::size_t queueSize = 0;
    std::size_t totalJobs = 0;
    std::map<Status, std::size_t> counts;
};

// Read side: every call returns copies taken from the Store.
class Flow final {
public:
    Flow(const Store& store, const Pool& pool) noexcept;

    Flow(const Flow&) = delete;
    Flow& operator=(const Flow&) = delete;
    Flow(Flow&&) = delete;
    Flow& operator=(Flow&&) = delete;

    [[nodiscard]] std::optional<JobSnapshot> get(const JobId& id) const noexcept;

    // Creation order; max == 0 returns every job.
    [[nodiscard]] std::vector<JobSnapshot> list(std::size_t max = 0) const noexcept;

    // Transcript text, only for Completed jobs whose artifact is readable.
    [[nodiscard]] std::optional<std::string> result(const JobId& id) const;

    [[nodiscard]] StatusReport status() const noexcept;

private:
    const Store& store_;
    const Pool& pool_;
};

}
