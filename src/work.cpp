/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/work.hpp"
#include "mediascribe/logger.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <sstream>
#include <sys/stat.h>

namespace mediascribe {

namespace {
bool sameFilesystem(const std::filesystem::path& src, const std::filesystem::path& destDir) {
    struct stat src_stat;
    struct stat dest_stat;
    if (::stat(src.c_str(), &src_stat) != 0) {
        return false;
    }
    if (::stat(destDir.c_str(), &dest_stat) != 0) {
        return false;
    }
    return src_stat.st_dev == dest_stat.st_dev;
}

bool validateSourcePath(const std::filesystem::path& path, std::uintmax_t& size, std::string& error) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        error = "Media file not found: " + path.string();
        return false;
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        error = "Media path is not a file: " + path.string();
        return false;
    }
    size = std::filesystem::file_size(path, ec);
    if (ec) {
        error = "Failed to read media size: " + path.string();
        return false;
    }
    if (size == 0) {
        error = "Media file is empty: " + path.string();
        return false;
    }
    return true;
}
}

Work::Work(Store& store, Hub& hub, Pool& pool, Workspace workspace) noexcept
    : store_(store), hub_(hub), pool_(pool), workspace_(std::move(workspace)) {}

SubmitResult Work::submit(const std::filesystem::path& source, std::string fileName) {
    std::uintmax_t size = 0;
    std::string error;
    if (!validateSourcePath(source, size, error)) {
        LOG_DEBUG("Submission refused: " + error);
        return {false, std::nullopt, SubmissionError::InvalidContent, redact(error)};
    }
    if (!pool_.isRunning()) {
        return {false, std::nullopt, SubmissionError::Unavailable, "Server is not accepting jobs"};
    }
    if (fileName.empty()) {
        fileName = source.filename().string();
    }

    auto staged = workspace_.uploads / stagedName(fileName);
    if (!stageSource(source, staged)) {
        LOG_ERROR("Failed to stage upload: " + source.string());
        return {false, std::nullopt, SubmissionError::IoError, "Failed to stage media file"};
    }

    JobSnapshot job = store_.create(staged, fileName, size);
    hub_.publish(job);

    if (!pool_.submit(job.id)) {
        // Stays Queued, like any job still waiting at shutdown
        LOG_WARN("Pool rejected job " + job.id);
        return {false, job, SubmissionError::Unavailable, "Server is shutting down"};
    }

    LOG_INFO("Job submitted successfully: " + job.id + " (" + fileName + ", " + std::to_string(size) + " bytes)");
    return {true, job, SubmissionError::None, ""};
}

std::string Work::stagedName(const std::string& fileName) {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::string safe;
    for (char c : std::filesystem::path(fileName).filename().string()) {
        safe += (std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '_') ? c : '_';
    }

    std::stringstream ss;
    ss << now << "_" << counter.fetch_add(1) << "_" << safe;
    return ss.str();
}

bool Work::stageSource(const std::filesystem::path& source, const std::filesystem::path& dest) const noexcept {
    try {
        std::error_code ec;
        std::filesystem::create_directories(dest.parent_path(), ec);
        if (sameFilesystem(source, dest.parent_path())) {
            std::filesystem::create_hard_link(source, dest, ec);
            if (!ec) {
                return true;
            }
            ec.clear();
        }
        std::filesystem::copy_file(source, dest, std::filesystem::copy_options::overwrite_existing, ec);
        return !ec;
    } catch (...) {
        return false;
    }
}

}
