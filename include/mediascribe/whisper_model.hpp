/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "mediascribe/transcribe.hpp"

struct whisper_context;
struct whisper_state;

namespace mediascribe {

struct WhisperOptions {
    bool useGpu = true;
    int threads = 0;                 // 0: derived from hardware concurrency
    std::string language = "auto";
};

// Reads a 16-bit PCM WAV file into mono float samples at 16 kHz.
// Throws TranscriptionError on anything else.
[[nodiscard]] std::vector<float> readWav16k(const std::filesystem::path& path);

// Hands whisper's segment notifications to a SegmentCallback. The first
// exception from the callback is kept; after it no more segments are
// relayed and the abort check asks whisper to stop decoding.
class SegmentRelay {
public:
    explicit SegmentRelay(const SpeechModel::SegmentCallback& onSegments) noexcept;

    void relay(int newSegments) noexcept;
    [[nodiscard]] bool failed() const noexcept { return !error_.empty(); }
    [[nodiscard]] const std::string& error() const noexcept { return error_; }

    // whisper_full_params callbacks; user_data is the relay
    static void onNewSegment(whisper_context* ctx, whisper_state* state, int n_new, void* user_data);
    static bool onAbortCheck(void* user_data);

private:
    const SpeechModel::SegmentCallback& onSegments_;
    std::string error_;
};

// whisper.cpp backed SpeechModel. The model weights are loaded once and
// shared by all workers; each transcription gets its own decoder state.
// The accelerator lease decides which worker runs on the GPU context;
// everyone else uses a CPU context loaded on first need.
class WhisperModel final : public LeasedSpeechModel {
public:
    WhisperModel(const std::string& modelPath, WhisperOptions options,
                 AcceleratorLease& lease = processAcceleratorLease());
    ~WhisperModel() override;

    WhisperModel(const WhisperModel&) = delete;
    WhisperModel& operator=(const WhisperModel&) = delete;
    WhisperModel(WhisperModel&&) = delete;
    WhisperModel& operator=(WhisperModel&&) = delete;

    [[nodiscard]] bool hasAccelerator() const noexcept override { return gpu_ != nullptr; }

protected:
    Transcript transcribeOn(ComputePath path,
                            const std::filesystem::path& audio,
                            const AudioReadyCallback& onAudioReady,
                            const SegmentCallback& onSegments) override;

private:
    [[nodiscard]] whisper_context* loadContext(bool useGpu) const;
    whisper_context* cpuContext();
    Transcript decode(whisper_context* ctx, const std::vector<float>& samples,
                      const SegmentCallback& onSegments);

    std::string modelPath_;
    WhisperOptions options_;

    std::shared_ptr<whisper_context> gpu_;
    std::shared_ptr<whisper_context> cpu_;
    std::mutex cpuMutex_;
};

}
