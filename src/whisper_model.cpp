/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/whisper_model.hpp"
#include "mediascribe/logger.hpp"
#include "mediascribe/types.hpp"
#include "whisper.h"
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <thread>

namespace mediascribe {

namespace {

// whisper.cpp's own log output, filtered by WHISPER_LOG_LEVEL (default: warn)
void whisperLogger(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    if (!text || text[0] == '.' || text[0] == '\n' || text[0] == '\0') {
        return;
    }

    static int filter_level = -1;
    if (filter_level == -1) {
        const char* env = std::getenv("WHISPER_LOG_LEVEL");
        filter_level = env ?
            (std::string(env) == "info" ? GGML_LOG_LEVEL_INFO :
             std::string(env) == "debug" ? GGML_LOG_LEVEL_DEBUG :
             std::string(env) == "error" ? GGML_LOG_LEVEL_ERROR :
             GGML_LOG_LEVEL_WARN) : GGML_LOG_LEVEL_WARN;
    }
    if (level == GGML_LOG_LEVEL_CONT || level < filter_level) {
        return;
    }

    std::string message(text);
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }

    switch (level) {
        case GGML_LOG_LEVEL_ERROR: LOG_ERROR("[whisper] " + message); break;
        case GGML_LOG_LEVEL_WARN:  LOG_WARN("[whisper] " + message); break;
        case GGML_LOG_LEVEL_INFO:  LOG_INFO("[whisper] " + message); break;
        default:                   LOG_DEBUG("[whisper] " + message); break;
    }
}

uint32_t readLE32(const unsigned char* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

uint16_t readLE16(const unsigned char* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

int defaultThreads() {
    int hw = static_cast<int>(std::thread::hardware_concurrency());
    return std::max(1, std::min(hw, 4));
}

}

SegmentRelay::SegmentRelay(const SpeechModel::SegmentCallback& onSegments) noexcept
    : onSegments_(onSegments) {}

void SegmentRelay::relay(int newSegments) noexcept {
    if (!error_.empty() || !onSegments_) {
        return;
    }
    // Never let an exception unwind through whisper's C frames
    try {
        onSegments_(newSegments);
    } catch (const std::exception& e) {
        error_ = e.what();
    } catch (...) {
        error_ = "unknown error in segment callback";
    }
}

void SegmentRelay::onNewSegment(whisper_context* /*ctx*/, whisper_state* /*state*/, int n_new, void* user_data) {
    if (auto* self = static_cast<SegmentRelay*>(user_data)) {
        self->relay(n_new);
    }
}

bool SegmentRelay::onAbortCheck(void* user_data) {
    auto* self = static_cast<SegmentRelay*>(user_data);
    return self && self->failed();
}

std::vector<float> readWav16k(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw TranscriptionError("Cannot open audio: " + path.string());
    }

    unsigned char header[12];
    if (!file.read(reinterpret_cast<char*>(header), sizeof(header)) ||
        std::memcmp(header, "RIFF", 4) != 0 || std::memcmp(header + 8, "WAVE", 4) != 0) {
        throw TranscriptionError("Audio is not a RIFF/WAVE file");
    }

    uint16_t format = 0, channels = 0, bits = 0;
    uint32_t sampleRate = 0;
    bool haveFmt = false;

    unsigned char chunk[8];
    while (file.read(reinterpret_cast<char*>(chunk), sizeof(chunk))) {
        uint32_t size = readLE32(chunk + 4);

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            std::vector<unsigned char> fmt(size);
            if (size < 16 || !file.read(reinterpret_cast<char*>(fmt.data()), size)) {
                throw TranscriptionError("Truncated WAV fmt chunk");
            }
            format = readLE16(fmt.data());
            channels = readLE16(fmt.data() + 2);
            sampleRate = readLE32(fmt.data() + 4);
            bits = readLE16(fmt.data() + 14);
            haveFmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!haveFmt) {
                throw TranscriptionError("WAV data chunk before fmt chunk");
            }
            if (format != 1 || bits != 16 || channels == 0) {
                throw TranscriptionError("Unsupported WAV encoding (need 16-bit PCM)");
            }
            if (sampleRate != WHISPER_SAMPLE_RATE) {
                throw TranscriptionError("Unsupported sample rate " + std::to_string(sampleRate));
            }

            // Never trust the header beyond what the file actually holds
            const auto dataStart = file.tellg();
            file.seekg(0, std::ios::end);
            const auto fileEnd = file.tellg();
            file.seekg(dataStart);
            if (dataStart < 0 || fileEnd < dataStart) {
                throw TranscriptionError("Cannot determine WAV data size");
            }
            const auto available = static_cast<uint64_t>(fileEnd - dataStart);
            const uint64_t bytes = std::min<uint64_t>(size, available);

            std::vector<int16_t> pcm(static_cast<std::size_t>(bytes / sizeof(int16_t)));
            file.read(reinterpret_cast<char*>(pcm.data()), static_cast<std::streamsize>(pcm.size() * sizeof(int16_t)));
            // ffmpeg may leave the size field unset when streaming; use what was read
            pcm.resize(static_cast<std::size_t>(file.gcount()) / sizeof(int16_t));

            std::vector<float> samples(pcm.size() / channels);
            for (std::size_t i = 0; i < samples.size(); ++i) {
                float sum = 0.0f;
                for (uint16_t c = 0; c < channels; ++c) {
                    sum += static_cast<float>(pcm[i * channels + c]) / 32768.0f;
                }
                samples[i] = sum / static_cast<float>(channels);
            }
            return samples;
        } else {
            file.seekg(size + (size & 1u), std::ios::cur);
        }
    }

    throw TranscriptionError("WAV file has no data chunk");
}

WhisperModel::WhisperModel(const std::string& modelPath, WhisperOptions options, AcceleratorLease& lease)
    : LeasedSpeechModel(lease), modelPath_(modelPath), options_(std::move(options)) {
    whisper_log_set(whisperLogger, nullptr);

    if (options_.threads <= 0) {
        options_.threads = defaultThreads();
    }

    LOG_INFO("Loading whisper model: " + modelPath_);

    if (options_.useGpu) {
        if (auto* ctx = loadContext(true)) {
            gpu_ = std::shared_ptr<whisper_context>(ctx, whisper_free);
            LOG_INFO("Whisper accelerator context ready");
        } else {
            LOG_WARN("GPU context unavailable, transcription will run on CPU");
        }
    }

    if (!gpu_) {
        if (auto* ctx = loadContext(false)) {
            cpu_ = std::shared_ptr<whisper_context>(ctx, whisper_free);
        } else {
            throw TranscriptionError("Failed to load whisper model: " + modelPath_);
        }
    }

    LOG_INFO("Whisper model loaded (" + std::string(whisper_print_system_info()) + ")");
}

WhisperModel::~WhisperModel() = default;

whisper_context* WhisperModel::loadContext(bool useGpu) const {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = useGpu;
    cparams.flash_attn = false;
    cparams.gpu_device = 0;
    return whisper_init_from_file_with_params_no_state(modelPath_.c_str(), cparams);
}

whisper_context* WhisperModel::cpuContext() {
    std::lock_guard<std::mutex> lock(cpuMutex_);
    if (!cpu_) {
        LOG_INFO("Loading CPU fallback context for concurrent transcription");
        auto* ctx = loadContext(false);
        if (!ctx) {
            throw TranscriptionError("Failed to load whisper model on CPU: " + modelPath_);
        }
        cpu_ = std::shared_ptr<whisper_context>(ctx, whisper_free);
    }
    return cpu_.get();
}

Transcript WhisperModel::transcribeOn(ComputePath path,
                                      const std::filesystem::path& audio,
                                      const AudioReadyCallback& onAudioReady,
                                      const SegmentCallback& onSegments) {
    std::vector<float> samples = readWav16k(audio);
    if (samples.empty()) {
        throw TranscriptionError("Audio contains no samples");
    }

    double duration = static_cast<double>(samples.size()) / WHISPER_SAMPLE_RATE;
    if (onAudioReady) {
        onAudioReady(duration);
    }

    if (path == ComputePath::Accelerator && gpu_) {
        return decode(gpu_.get(), samples, onSegments);
    }
    return decode(cpuContext(), samples, onSegments);
}

Transcript WhisperModel::decode(whisper_context* ctx, const std::vector<float>& samples,
                                const SegmentCallback& onSegments) {
    std::unique_ptr<whisper_state, decltype(&whisper_free_state)> state(whisper_init_state(ctx), whisper_free_state);
    if (!state) {
        throw TranscriptionError("Failed to allocate whisper decoder state");
    }

    SegmentRelay relay(onSegments);

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads = options_.threads;
    params.language = options_.language.empty() ? "auto" : options_.language.c_str();
    params.translate = false;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_special = false;
    params.print_timestamps = false;
    params.new_segment_callback = SegmentRelay::onNewSegment;
    params.new_segment_callback_user_data = &relay;
    params.abort_callback = SegmentRelay::onAbortCheck;
    params.abort_callback_user_data = &relay;

    int rc = whisper_full_with_state(ctx, state.get(), params, samples.data(), static_cast<int>(samples.size()));
    if (relay.failed()) {
        throw TranscriptionError("Progress reporting failed: " + relay.error());
    }
    if (rc != 0) {
        throw TranscriptionError("Whisper decoding failed with code " + std::to_string(rc));
    }

    Transcript transcript;
    const int n = whisper_full_n_segments_from_state(state.get());
    transcript.segments = static_cast<std::size_t>(std::max(0, n));
    transcript.timeline.reserve(transcript.segments);
    for (int i = 0; i < n; ++i) {
        const char* text = whisper_full_get_segment_text_from_state(state.get(), i);
        if (!text) {
            continue;
        }
        // whisper timestamps are in units of 10 ms
        Segment segment;
        segment.text = text;
        segment.start = static_cast<double>(whisper_full_get_segment_t0_from_state(state.get(), i)) / 100.0;
        segment.end = static_cast<double>(whisper_full_get_segment_t1_from_state(state.get(), i)) / 100.0;
        transcript.text += segment.text;
        transcript.timeline.push_back(std::move(segment));
    }

    int langId = whisper_full_lang_id_from_state(state.get());
    if (langId >= 0) {
        if (const char* lang = whisper_lang_str(langId)) {
            transcript.language = lang;
        }
    }

    return transcript;
}

}
