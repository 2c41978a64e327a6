/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unistd.h>
#include <vector>

#include "mediascribe/logger.hpp"
#include "mediascribe/transcribe.hpp"

using namespace mediascribe;

namespace {

// Two-backend model whose calls wait for each other, so concurrent
// transcriptions really overlap.
class OverlappingModel : public LeasedSpeechModel {
public:
    OverlappingModel(AcceleratorLease& lease, bool accelerator, int expectedCallers)
        : LeasedSpeechModel(lease), accelerator_(accelerator), expected_(expectedCallers) {}

    bool hasAccelerator() const noexcept override { return accelerator_; }

    std::vector<ComputePath> paths() {
        std::lock_guard<std::mutex> lock(mutex_);
        return paths_;
    }

protected:
    Transcript transcribeOn(ComputePath path, const std::filesystem::path&,
                            const AudioReadyCallback& onAudioReady,
                            const SegmentCallback& onSegments) override {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            paths_.push_back(path);
            ++inside_;
            cv_.notify_all();
            cv_.wait_for(lock, std::chrono::seconds(3), [this] { return inside_ >= expected_; });
        }

        onAudioReady(20.0);  // 4 estimated segments
        Transcript t;
        for (int i = 0; i < 4; ++i) {
            onSegments(1);
            t.timeline.push_back({"part " + std::to_string(i), i * 1.0, i * 1.0 + 0.8});
        }
        t.segments = t.timeline.size();
        return t;
    }

private:
    bool accelerator_;
    int expected_;
    std::mutex mutex_;
    std::condition_variable cv_;
    int inside_ = 0;
    std::vector<ComputePath> paths_;
};

struct Run {
    std::vector<double> progress;
    Transcript transcript;
};

Run runStage(SpeechModel& model, const std::filesystem::path& audio, const std::filesystem::path& target) {
    Run run;
    TranscribeStage stage(model);
    run.transcript = stage.run(audio, target, [&](double p, const std::string&) {
        run.progress.push_back(p);
    });
    return run;
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}

int main() {
    Logger::setLevel(LogLevel::ERROR);

    auto root = std::filesystem::temp_directory_path() / ("mediascribe_accel_" + std::to_string(::getpid()));
    std::filesystem::create_directories(root);
    auto audioA = root / "a.wav";
    auto audioB = root / "b.wav";
    std::ofstream(audioA) << "RIFF";
    std::ofstream(audioB) << "RIFF";

    std::cout << "[Test] Lease is exclusive and never blocks..." << std::endl;
    {
        AcceleratorLease lease;
        {
            auto first = lease.acquire(true);
            assert(first.path() == ComputePath::Accelerator);
            auto second = lease.acquire(true);
            assert(second.path() == ComputePath::Cpu);
            auto cpuOnly = lease.acquire(false);
            assert(cpuOnly.path() == ComputePath::Cpu);
        }
        // released with the first ticket
        auto again = lease.acquire(true);
        assert(again.path() == ComputePath::Accelerator);
    }

    std::cout << "[Test] Concurrent transcriptions split across accelerator and CPU..." << std::endl;
    {
        AcceleratorLease lease;
        OverlappingModel model(lease, true, 2);

        Run a;
        Run b;
        std::thread ta([&] { a = runStage(model, audioA, root / "a.txt"); });
        std::thread tb([&] { b = runStage(model, audioB, root / "b.txt"); });
        ta.join();
        tb.join();

        auto paths = model.paths();
        assert(paths.size() == 2);
        assert(paths[0] != paths[1]);
        assert(a.transcript.accelerated != b.transcript.accelerated);

        // The caller cannot tell the paths apart from progress
        assert(a.progress == b.progress);
        assert(a.progress.front() == 50.0);
        assert(a.progress.back() == 100.0);
        for (std::size_t i = 1; i < a.progress.size(); ++i) {
            assert(a.progress[i] >= a.progress[i - 1]);
            assert(a.progress[i] >= 50.0 && a.progress[i] <= 100.0);
        }

        assert(a.transcript.text == "part 0 part 1 part 2 part 3");
        assert(readFile(root / "a.txt") == a.transcript.text);
        assert(readFile(root / "b.txt") == b.transcript.text);

        // Lease was returned by whichever run held it
        auto ticket = lease.acquire(true);
        assert(ticket.path() == ComputePath::Accelerator);
    }

    std::cout << "[Test] Without an accelerator every run takes the CPU path..." << std::endl;
    {
        AcceleratorLease lease;
        OverlappingModel model(lease, false, 1);
        Run run = runStage(model, audioA, root / "c.txt");
        assert(!run.transcript.accelerated);
        assert(model.paths() == std::vector<ComputePath>{ComputePath::Cpu});
        assert(run.progress.back() == 100.0);
    }

    std::filesystem::remove_all(root);
    std::cout << "[Test] Accelerator tests passed." << std::endl;
    return 0;
}
