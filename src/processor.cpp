/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/processor.hpp"
#include "mediascribe/logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {
std::mutex g_output_mutex;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    return buf;
}

void announce(const std::string& jobId, const std::string& state, const std::string& detail = {}) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << "    \033[90m" << timestamp() << "\033[0m  " << jobId << "  " << state;
    if (!detail.empty()) {
        std::cout << "  " << detail;
    }
    std::cout << "\n" << std::flush;
}

std::string seconds(std::chrono::steady_clock::time_point start) {
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << elapsed << "s";
    return out.str();
}

}

namespace mediascribe {

Workspace Workspace::under(const std::filesystem::path& root) {
    return Workspace{root / "uploads", root / "audio", root / "transcripts"};
}

void Workspace::create() const {
    std::filesystem::create_directories(uploads);
    std::filesystem::create_directories(audio);
    std::filesystem::create_directories(transcripts);
}

Processor::Processor(Store& store, Hub& hub, TranscodeTool& transcoder, SpeechModel& model,
                     Workspace workspace, double segmentSeconds)
    : store_(store), hub_(hub), transcode_(transcoder), transcribe_(model, segmentSeconds),
      workspace_(std::move(workspace)) {
    LOG_DEBUG("Processor created, intermediates in " + workspace_.audio.string());
}

ProcessResult Processor::process(const JobId& jobId, int workerId) noexcept {
    LOG_DEBUG("Worker " + std::to_string(workerId) + " processing job: " + jobId);

    if (!claim(jobId)) {
        LOG_DEBUG("Job not found or no longer queued: " + jobId);
        return ProcessResult::NotFound;
    }

    announce(jobId, "\033[33mrunning\033[0m");
    auto startTime = std::chrono::steady_clock::now();

    try {
        auto job = store_.get(jobId);
        if (!job) {
            throw InternalError("Job disappeared from store");
        }

        auto sink = [this, &jobId](const std::string& label) {
            return [this, &jobId, label](double progress, const std::string& message) {
                update(jobId, [&](Job& j) { recordProgress(j, progress, label, message); });
            };
        };

        // Stage 1
        auto audioPath = workspace_.audio / (jobId + ".wav");
        transcode_.run(job->sourceRef, audioPath, sink("Extracting audio"));
        update(jobId, [&](Job& j) {
            j.intermediateRef = audioPath;
            transition(j, Status::Stage2Running);
            recordProgress(j, kTranscribeBegin, "Transcribing", "Starting transcription...");
        });

        // Stage 2
        auto transcriptPath = workspace_.transcripts / (jobId + ".txt");
        Transcript transcript = transcribe_.run(audioPath, transcriptPath, sink("Transcribing"));
        update(jobId, [&](Job& j) {
            j.resultRef = transcriptPath;
            recordProgress(j, kTranscribeEnd, "Completed", "Transcription completed successfully");
            transition(j, Status::Completed);
        });

        announce(jobId, "\033[32mdone\033[0m", seconds(startTime));
        LOG_INFO("JOB COMPLETED: " + jobId + " -> " + std::to_string(transcript.segments) + " segments, " +
                 std::to_string(transcript.text.size()) + " chars" +
                 (transcript.language.empty() ? "" : " [" + transcript.language + "]") +
                 (transcript.accelerated ? " (gpu)" : " (cpu)"));
        return ProcessResult::Success;

    } catch (const TranscodeError& e) {
        std::string detail = e.what();
        if (!e.tail().empty()) {
            detail += ": " + e.tail();
        }
        LOG_WARN("Job failed during audio extraction: " + jobId + " - " + detail);
        announce(jobId, "\033[31mfailed\033[0m", seconds(startTime));
        return fail(jobId, ErrorKind::Transcode, detail);
    } catch (const PipelineError& e) {
        if (e.kind() == ErrorKind::Internal) {
            LOG_ERROR("Internal error processing job " + jobId + ": " + std::string(e.what()));
        } else {
            LOG_WARN("Job failed during transcription: " + jobId + " - " + std::string(e.what()));
        }
        announce(jobId, "\033[31mfailed\033[0m", seconds(startTime));
        return fail(jobId, e.kind(), e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Exception processing job " + jobId + ": " + std::string(e.what()));
        announce(jobId, "\033[31mfailed\033[0m", seconds(startTime));
        return fail(jobId, ErrorKind::Internal, "Internal processing error: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Unknown exception processing job: " + jobId);
        announce(jobId, "\033[31mfailed\033[0m", seconds(startTime));
        return fail(jobId, ErrorKind::Internal, "Unknown internal processing error");
    }
}

void Processor::update(const JobId& jobId, const std::function<void(Job&)>& fn) {
    JobSnapshot snapshot = store_.mutate(jobId, fn);
    hub_.publish(snapshot);
}

bool Processor::claim(const JobId& jobId) noexcept {
    try {
        auto job = store_.get(jobId);
        if (!job || job->status != Status::Queued) {
            return false;
        }
        update(jobId, [](Job& j) {
            transition(j, Status::Stage1Running);
            recordProgress(j, kTranscodeBegin, "Extracting audio", "Starting audio extraction...");
        });
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to claim job " + jobId + ": " + std::string(e.what()));
        return false;
    }
}

ProcessResult Processor::fail(const JobId& jobId, ErrorKind kind, const std::string& detail) noexcept {
    try {
        update(jobId, [&](Job& j) { markFailed(j, kind, redact(detail)); });
        return kind == ErrorKind::Internal ? ProcessResult::SystemError : ProcessResult::Failed;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record failure for job " + jobId + ": " + std::string(e.what()));
        return ProcessResult::SystemError;
    }
}

}
