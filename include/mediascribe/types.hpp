/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace mediascribe {

// Job lifecycle states. Completed and Failed are terminal.
enum class Status : std::uint8_t { Queued, Stage1Running, Stage2Running, Completed, Failed };

enum class ErrorKind : std::uint8_t { None, Validation, Transcode, Transcription, Internal };

// Opaque job identifier
using JobId = std::string;

[[nodiscard]] const char* toString(Status status) noexcept;
[[nodiscard]] const char* toString(ErrorKind kind) noexcept;
[[nodiscard]] std::optional<Status> parseStatus(const std::string& value) noexcept;
[[nodiscard]] bool isTerminal(Status status) noexcept;
[[nodiscard]] bool isRunning(Status status) noexcept;

// Base of everything a pipeline stage may throw. The Processor is the only
// place these are caught and turned into a Failed job.
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class TranscodeError : public PipelineError {
public:
    explicit TranscodeError(const std::string& message, std::string toolTail = {})
        : PipelineError(ErrorKind::Transcode, message), tail_(std::move(toolTail)) {}

    // Last lines of the tool's diagnostic output
    [[nodiscard]] const std::string& tail() const noexcept { return tail_; }

private:
    std::string tail_;
};

class TranscriptionError : public PipelineError {
public:
    explicit TranscriptionError(const std::string& message)
        : PipelineError(ErrorKind::Transcription, message) {}
};

class InternalError : public PipelineError {
public:
    explicit InternalError(const std::string& message)
        : PipelineError(ErrorKind::Internal, message) {}
};

// Strips filesystem paths and caps length so a message is safe to publish.
[[nodiscard]] std::string redact(const std::string& message, std::size_t maxLength = 512);

} // namespace mediascribe
