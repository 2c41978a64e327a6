/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "mediascribe/progress.hpp"
#include "mediascribe/text_format.hpp"
#include "mediascribe/transcode.hpp"

namespace mediascribe {

struct Transcript {
    std::string text;
    std::size_t segments = 0;
    std::vector<Segment> timeline;  // when present, text is rebuilt from it
    std::string language;
    bool accelerated = false;  // ran on the GPU context
};

// The speech recognizer, seen as a black box with incremental callbacks.
class SpeechModel {
public:
    using AudioReadyCallback = std::function<void(double durationSeconds)>;
    using SegmentCallback = std::function<void(int newSegments)>;

    virtual ~SpeechModel() = default;

    // Decodes the audio file. onAudioReady fires once, after the audio is
    // loaded and before decoding starts; onSegments fires as decoding yields
    // new segments. Throws TranscriptionError.
    virtual Transcript transcribe(const std::filesystem::path& audio,
                                  const AudioReadyCallback& onAudioReady,
                                  const SegmentCallback& onSegments) = 0;
};

enum class ComputePath { Accelerator, Cpu };

// Exclusive use of the accelerator. At most one Ticket at a time is on the
// Accelerator path; a caller that finds it taken gets a Cpu ticket instead
// of waiting. The lease is released when the Ticket goes away.
class AcceleratorLease {
public:
    class Ticket {
    public:
        [[nodiscard]] ComputePath path() const noexcept {
            return lock_.owns_lock() ? ComputePath::Accelerator : ComputePath::Cpu;
        }

    private:
        friend class AcceleratorLease;
        explicit Ticket(std::unique_lock<std::mutex> lock) noexcept : lock_(std::move(lock)) {}

        std::unique_lock<std::mutex> lock_;
    };

    AcceleratorLease() = default;
    AcceleratorLease(const AcceleratorLease&) = delete;
    AcceleratorLease& operator=(const AcceleratorLease&) = delete;

    // Never blocks. With wantAccelerator false the ticket is always Cpu.
    [[nodiscard]] Ticket acquire(bool wantAccelerator) noexcept;

private:
    std::mutex mutex_;
};

// The lease shared by every model in the process.
[[nodiscard]] AcceleratorLease& processAcceleratorLease();

// A SpeechModel with an accelerated backend and a CPU backend. Every call
// holds a ticket from the lease for its whole run and decodes on the path
// the ticket names; callers see the same callbacks on both paths.
class LeasedSpeechModel : public SpeechModel {
public:
    explicit LeasedSpeechModel(AcceleratorLease& lease) noexcept : lease_(lease) {}

    Transcript transcribe(const std::filesystem::path& audio,
                          const AudioReadyCallback& onAudioReady,
                          const SegmentCallback& onSegments) final;

    [[nodiscard]] virtual bool hasAccelerator() const noexcept = 0;

protected:
    virtual Transcript transcribeOn(ComputePath path,
                                    const std::filesystem::path& audio,
                                    const AudioReadyCallback& onAudioReady,
                                    const SegmentCallback& onSegments) = 0;

private:
    AcceleratorLease& lease_;
};

// Stage 2: runs the model and maps decoded segments onto [50, 100].
class TranscribeStage {
public:
    explicit TranscribeStage(SpeechModel& model, double segmentSeconds = kDefaultSegmentSeconds) noexcept
        : model_(model), segmentSeconds_(segmentSeconds) {}

    // Writes the transcript to target. Throws TranscriptionError.
    Transcript run(const std::filesystem::path& audio,
                   const std::filesystem::path& target,
                   const ProgressSink& sink);

private:
    static void writeTranscript(const std::filesystem::path& target, const std::string& text);

    SpeechModel& model_;
    double segmentSeconds_;
};

}
