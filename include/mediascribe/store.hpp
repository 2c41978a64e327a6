/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mediascribe/job.hpp"

namespace mediascribe {

// The single owner of every Job. Readers only ever receive copies; the
// worker that owns a job mutates it through mutate().
class Store final {
public:
    Store() = default;

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;
    Store(Store&&) = delete;
    Store& operator=(Store&&) = delete;

    [[nodiscard]] JobSnapshot create(const std::filesystem::path& source,
                                     const std::string& fileName,
                                     std::uintmax_t fileSize);

    [[nodiscard]] std::optional<JobSnapshot> get(const JobId& id) const;
    [[nodiscard]] std::vector<JobSnapshot> list() const;  // creation order
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::map<Status, std::size_t> countByStatus() const;

    // Applies fn to the live job under the store lock and returns the
    // resulting snapshot. Throws InternalError for an unknown id.
    JobSnapshot mutate(const JobId& id, const std::function<void(Job&)>& fn);

private:
    [[nodiscard]] static JobId generateId();

    mutable std::mutex mutex_;
    std::unordered_map<JobId, Job> jobs_;
    std::vector<JobId> order_;
};

}
