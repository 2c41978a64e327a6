/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/transcribe.hpp"
#include "mediascribe/logger.hpp"
#include "mediascribe/types.hpp"
#include <fstream>
#include <memory>

namespace mediascribe {

namespace {

std::string trimCopy(const std::string& text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

}

AcceleratorLease::Ticket AcceleratorLease::acquire(bool wantAccelerator) noexcept {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (wantAccelerator) {
        (void)lock.try_lock();
    }
    return Ticket(std::move(lock));
}

AcceleratorLease& processAcceleratorLease() {
    static AcceleratorLease lease;
    return lease;
}

Transcript LeasedSpeechModel::transcribe(const std::filesystem::path& audio,
                                         const AudioReadyCallback& onAudioReady,
                                         const SegmentCallback& onSegments) {
    auto ticket = lease_.acquire(hasAccelerator());
    if (ticket.path() == ComputePath::Accelerator) {
        LOG_DEBUG("Accelerator lease acquired");
    } else if (hasAccelerator()) {
        LOG_DEBUG("Accelerator busy, using CPU path");
    }

    Transcript transcript = transcribeOn(ticket.path(), audio, onAudioReady, onSegments);
    transcript.accelerated = ticket.path() == ComputePath::Accelerator;
    return transcript;
}

Transcript TranscribeStage::run(const std::filesystem::path& audio,
                                const std::filesystem::path& target,
                                const ProgressSink& sink) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(audio, ec)) {
        throw TranscriptionError("Normalized audio is missing: " + audio.string());
    }

    sink(kTranscribeBegin, "Loading audio...");

    std::unique_ptr<TranscriptionTracker> tracker;
    Transcript transcript = model_.transcribe(audio,
        [&](double durationSeconds) {
            auto estimated = estimateUnits(durationSeconds, segmentSeconds_);
            tracker = std::make_unique<TranscriptionTracker>(estimated);
            LOG_DEBUG("Audio duration: " + std::to_string(durationSeconds) + "s, estimated segments: " +
                      std::to_string(estimated));
            sink(tracker->progress(), "Transcribing: segment 0/" + std::to_string(estimated));
        },
        [&](int newSegments) {
            if (!tracker) {
                // Model skipped onAudioReady; fall back to a single-unit estimate
                tracker = std::make_unique<TranscriptionTracker>(1);
            }
            double progress = tracker->onUnits(newSegments);
            sink(progress, "Transcribing: segment " + std::to_string(tracker->units()) + "/" +
                           std::to_string(tracker->estimated()));
        });

    if (!transcript.timeline.empty()) {
        transcript.text = formatSegments(transcript.timeline);
    } else {
        transcript.text = trimCopy(transcript.text);
    }
    writeTranscript(target, transcript.text);

    if (!tracker) {
        tracker = std::make_unique<TranscriptionTracker>(1);
    }
    sink(tracker->finish(), "Transcription complete");
    LOG_DEBUG("Transcript written: " + target.filename().string() + " (" +
              std::to_string(transcript.text.size()) + " chars, " +
              std::to_string(transcript.segments) + " segments)");
    return transcript;
}

void TranscribeStage::writeTranscript(const std::filesystem::path& target, const std::string& text) {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);

    auto tempPath = target;
    tempPath += ".tmp";
    {
        std::ofstream file(tempPath, std::ios::binary);
        if (!file) {
            throw TranscriptionError("Cannot open transcript for writing: " + tempPath.string());
        }
        file << text;
        file.flush();
        if (!file.good()) {
            throw TranscriptionError("Failed to write transcript: " + tempPath.string());
        }
    }

    std::filesystem::rename(tempPath, target, ec);
    if (ec) {
        std::filesystem::remove(tempPath, ec);
        throw TranscriptionError("Failed to publish transcript: " + target.string());
    }
}

}
