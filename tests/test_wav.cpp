/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <cassert>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

#include "mediascribe/types.hpp"
#include "mediascribe/whisper_model.hpp"

using namespace mediascribe;

namespace {

void put16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xff));
    out.push_back(static_cast<char>((v >> 8) & 0xff));
}

void put32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
    }
}

void writeWav(const std::filesystem::path& path, const std::vector<int16_t>& pcm,
              uint16_t channels, uint32_t rate, bool withListChunk = false,
              uint32_t declaredDataSize = 0) {
    std::string fmt;
    put16(fmt, 1);
    put16(fmt, channels);
    put32(fmt, rate);
    put32(fmt, rate * channels * 2);
    put16(fmt, static_cast<uint16_t>(channels * 2));
    put16(fmt, 16);

    std::string body = "WAVE";
    body += "fmt ";
    put32(body, static_cast<uint32_t>(fmt.size()));
    body += fmt;
    if (withListChunk) {
        body += "LIST";
        put32(body, 5);
        body += "INFOx";
        body.push_back('\0');  // pad to even size
    }
    body += "data";
    put32(body, declaredDataSize ? declaredDataSize : static_cast<uint32_t>(pcm.size() * 2));
    for (int16_t s : pcm) {
        put16(body, static_cast<uint16_t>(s));
    }

    std::string file = "RIFF";
    put32(file, static_cast<uint32_t>(body.size()));
    file += body;
    std::ofstream(path, std::ios::binary) << file;
}

template <typename Fn>
bool throwsTranscription(Fn fn) {
    try {
        fn();
    } catch (const TranscriptionError&) {
        return true;
    }
    return false;
}

}

int main() {
    auto dir = std::filesystem::temp_directory_path() / ("mediascribe_wav_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    std::cout << "[Test] Mono 16 kHz PCM..." << std::endl;
    {
        std::vector<int16_t> pcm(16000, 0);
        pcm[0] = 16384;
        pcm[1] = -32768;
        writeWav(dir / "mono.wav", pcm, 1, 16000, true);

        auto samples = readWav16k(dir / "mono.wav");
        assert(samples.size() == 16000);
        assert(std::fabs(samples[0] - 0.5f) < 1e-6f);
        assert(std::fabs(samples[1] + 1.0f) < 1e-6f);
        assert(samples[2] == 0.0f);
    }

    std::cout << "[Test] Stereo is averaged to mono..." << std::endl;
    {
        std::vector<int16_t> pcm = {16384, 0, -16384, -16384};
        writeWav(dir / "stereo.wav", pcm, 2, 16000);

        auto samples = readWav16k(dir / "stereo.wav");
        assert(samples.size() == 2);
        assert(std::fabs(samples[0] - 0.25f) < 1e-6f);
        assert(std::fabs(samples[1] + 0.5f) < 1e-6f);
    }

    std::cout << "[Test] Data size beyond the end of the file is clamped..." << std::endl;
    {
        std::vector<int16_t> pcm = {100, 200, 300};
        writeWav(dir / "truncated.wav", pcm, 1, 16000, false, 0xFFFFFFFFu);

        auto samples = readWav16k(dir / "truncated.wav");
        assert(samples.size() == 3);
        assert(std::fabs(samples[2] - 300.0f / 32768.0f) < 1e-6f);
    }

    std::cout << "[Test] Other inputs are rejected..." << std::endl;
    {
        writeWav(dir / "44k.wav", std::vector<int16_t>(100, 0), 1, 44100);
        assert(throwsTranscription([&] { (void)readWav16k(dir / "44k.wav"); }));

        std::ofstream(dir / "text.wav") << "definitely not a wave file";
        assert(throwsTranscription([&] { (void)readWav16k(dir / "text.wav"); }));

        assert(throwsTranscription([&] { (void)readWav16k(dir / "missing.wav"); }));
    }

    std::cout << "[Test] A failing segment callback stops decoding..." << std::endl;
    {
        int calls = 0;
        SpeechModel::SegmentCallback onSegments = [&](int n) {
            calls += n;
            if (calls == 2) {
                throw std::runtime_error("sink closed");
            }
        };
        SegmentRelay relay(onSegments);

        SegmentRelay::onNewSegment(nullptr, nullptr, 1, &relay);
        assert(!SegmentRelay::onAbortCheck(&relay));
        SegmentRelay::onNewSegment(nullptr, nullptr, 1, &relay);
        assert(relay.failed());
        assert(relay.error() == "sink closed");
        assert(SegmentRelay::onAbortCheck(&relay));

        SegmentRelay::onNewSegment(nullptr, nullptr, 3, &relay);
        assert(calls == 2);
    }

    std::filesystem::remove_all(dir);
    std::cout << "[Test] WAV tests passed." << std::endl;
    return 0;
}
