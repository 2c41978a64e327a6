/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>
#include <unistd.h>
#include <vector>

#include "mediascribe/logger.hpp"
#include "mediascribe/pool.hpp"
#include "mediascribe/processor.hpp"

using namespace mediascribe;

namespace {

// Emits ffmpeg-like status lines and writes a small output file.
class FakeTranscoder : public TranscodeTool {
public:
    std::optional<double> probeDuration(const std::filesystem::path&) override {
        return duration;
    }

    ToolResult convert(const std::filesystem::path& source, const std::filesystem::path& target,
                       const LineCallback& onLine) override {
        int now = running.fetch_add(1) + 1;
        int seen = maxRunning.load();
        while (now > seen && !maxRunning.compare_exchange_weak(seen, now)) {
        }

        for (const auto& line : lines) {
            onLine(line);
            std::this_thread::sleep_for(delay);
        }
        running.fetch_sub(1);

        ToolResult r;
        if (exitCode != 0) {
            r.exitCode = exitCode;
            r.tail = "Error opening input " + source.string() + ": Invalid data found when processing input";
            return r;
        }
        std::ofstream(target, std::ios::binary) << "RIFF....WAVE";
        r.ok = true;
        r.exitCode = 0;
        return r;
    }

    std::optional<double> duration = 60.0;
    std::vector<std::string> lines = {"time=00:00:15.00", "time=00:00:30.00", "time=00:00:20.00", "time=00:01:00.00"};
    int exitCode = 0;
    std::chrono::milliseconds delay{5};
    std::atomic<int> running{0};
    std::atomic<int> maxRunning{0};
};

class FakeModel : public SpeechModel {
public:
    Transcript transcribe(const std::filesystem::path&, const AudioReadyCallback& onAudioReady,
                          const SegmentCallback& onSegments) override {
        onAudioReady(audioSeconds);
        for (int i = 0; i < segments; ++i) {
            if (failAt >= 0 && i == failAt) {
                throw TranscriptionError("decoder failed");
            }
            onSegments(1);
        }
        Transcript t;
        t.text = "  hello world \n";
        t.segments = static_cast<std::size_t>(segments);
        t.language = "en";
        return t;
    }

    double audioSeconds = 200.0;  // 40 estimated segments
    int segments = 50;
    int failAt = -1;
};

class Recorder : public Observer {
public:
    bool deliver(const JobSnapshot& s) override {
        std::lock_guard<std::mutex> lock(mutex);
        updates[s.id].push_back(s);
        return true;
    }

    std::vector<JobSnapshot> of(const JobId& id) {
        std::lock_guard<std::mutex> lock(mutex);
        return updates[id];
    }

    std::mutex mutex;
    std::map<JobId, std::vector<JobSnapshot>> updates;
};

void checkMonotonic(const std::vector<JobSnapshot>& seq) {
    assert(!seq.empty());
    for (std::size_t i = 1; i < seq.size(); ++i) {
        assert(seq[i].progress >= seq[i - 1].progress);
        assert(static_cast<int>(seq[i].status) >= static_cast<int>(seq[i - 1].status));
    }
    for (const auto& s : seq) {
        if (s.status == Status::Stage1Running) {
            assert(s.progress >= 0.0 && s.progress <= 50.0);
        } else if (s.status == Status::Stage2Running) {
            assert(s.progress >= 50.0 && s.progress <= 100.0);
        } else if (s.status == Status::Completed) {
            assert(s.progress == 100.0);
        }
    }
}

bool saw(const std::vector<JobSnapshot>& seq, Status status) {
    for (const auto& s : seq) {
        if (s.status == status) {
            return true;
        }
    }
    return false;
}

std::filesystem::path makeSource(const std::filesystem::path& dir, const std::string& name) {
    auto path = dir / name;
    std::ofstream(path, std::ios::binary) << "media bytes";
    return path;
}

}

int main() {
    Logger::setLevel(LogLevel::ERROR);

    auto root = std::filesystem::temp_directory_path() / ("mediascribe_processor_" + std::to_string(::getpid()));
    std::filesystem::remove_all(root);
    Workspace workspace = Workspace::under(root);
    workspace.create();

    std::cout << "[Test] A job runs both stages and completes at 100..." << std::endl;
    {
        Store store;
        Hub hub;
        auto recorder = std::make_shared<Recorder>();
        hub.add(recorder);
        FakeTranscoder transcoder;
        FakeModel model;
        Processor processor(store, hub, transcoder, model, workspace);

        auto job = store.create(makeSource(root, "talk.mp4"), "talk.mp4", 11);
        assert(processor.process(job.id, 0) == ProcessResult::Success);

        auto done = store.get(job.id);
        assert(done && done->status == Status::Completed);
        assert(done->progress == 100.0);
        assert(done->completedAt);
        assert(done->errorKind == ErrorKind::None);
        assert(std::filesystem::exists(done->intermediateRef));

        std::ifstream result(done->resultRef);
        std::string text((std::istreambuf_iterator<char>(result)), std::istreambuf_iterator<char>());
        assert(text == "hello world");

        auto seq = recorder->of(job.id);
        checkMonotonic(seq);
        assert(saw(seq, Status::Stage1Running));
        assert(saw(seq, Status::Stage2Running));
        assert(seq.back().status == Status::Completed);

        bool sawQuarter = false;
        for (const auto& s : seq) {
            sawQuarter = sawQuarter || (s.status == Status::Stage1Running && s.progress == 25.0);
        }
        assert(sawQuarter);

        // Already terminal: nothing to claim
        assert(processor.process(job.id, 0) == ProcessResult::NotFound);
        assert(processor.process("no-such-job", 0) == ProcessResult::NotFound);
    }

    std::cout << "[Test] Transcoder failure ends Failed and never reaches stage 2..." << std::endl;
    {
        Store store;
        Hub hub;
        auto recorder = std::make_shared<Recorder>();
        hub.add(recorder);
        FakeTranscoder transcoder;
        transcoder.exitCode = 1;
        FakeModel model;
        Processor processor(store, hub, transcoder, model, workspace);

        auto job = store.create(makeSource(root, "broken.mp4"), "broken.mp4", 11);
        assert(processor.process(job.id, 0) == ProcessResult::Failed);

        auto failed = store.get(job.id);
        assert(failed->status == Status::Failed);
        assert(failed->errorKind == ErrorKind::Transcode);
        assert(failed->resultRef.empty());
        assert(failed->errorDetail.find("Invalid data found") != std::string::npos);
        assert(failed->errorDetail.find(root.string()) == std::string::npos);
        assert(failed->errorDetail.size() <= 512);

        auto seq = recorder->of(job.id);
        checkMonotonic(seq);
        assert(!saw(seq, Status::Stage2Running));
        assert(!saw(seq, Status::Completed));
        assert(seq.back().status == Status::Failed);
        assert(!std::filesystem::exists(workspace.transcripts / (job.id + ".txt")));
    }

    std::cout << "[Test] Unknown duration reports the midpoint during stage 1..." << std::endl;
    {
        Store store;
        Hub hub;
        auto recorder = std::make_shared<Recorder>();
        hub.add(recorder);
        FakeTranscoder transcoder;
        transcoder.duration = std::nullopt;
        FakeModel model;
        Processor processor(store, hub, transcoder, model, workspace);

        auto job = store.create(makeSource(root, "stream.ts"), "stream.ts", 11);
        assert(processor.process(job.id, 0) == ProcessResult::Success);

        auto seq = recorder->of(job.id);
        checkMonotonic(seq);
        for (const auto& s : seq) {
            if (s.status == Status::Stage1Running) {
                assert(s.progress == 0.0 || s.progress == kIndeterminateProgress || s.progress == 50.0);
            }
        }
    }

    std::cout << "[Test] Transcription failure keeps progress and reports the kind..." << std::endl;
    {
        Store store;
        Hub hub;
        auto recorder = std::make_shared<Recorder>();
        hub.add(recorder);
        FakeTranscoder transcoder;
        FakeModel model;
        model.failAt = 10;
        Processor processor(store, hub, transcoder, model, workspace);

        auto job = store.create(makeSource(root, "noisy.wav"), "noisy.wav", 11);
        assert(processor.process(job.id, 1) == ProcessResult::Failed);

        auto failed = store.get(job.id);
        assert(failed->status == Status::Failed);
        assert(failed->errorKind == ErrorKind::Transcription);
        assert(failed->progress >= 50.0 && failed->progress < 100.0);
        assert(failed->errorDetail == "decoder failed");
        checkMonotonic(recorder->of(job.id));
    }

    std::cout << "[Test] Missing source fails in stage 1..." << std::endl;
    {
        Store store;
        Hub hub;
        FakeTranscoder transcoder;
        FakeModel model;
        Processor processor(store, hub, transcoder, model, workspace);

        auto job = store.create(root / "vanished.mp4", "vanished.mp4", 11);
        assert(processor.process(job.id, 0) == ProcessResult::Failed);
        assert(store.get(job.id)->errorKind == ErrorKind::Transcode);
        assert(store.get(job.id)->errorDetail.find(root.string()) == std::string::npos);
    }

    std::cout << "[Test] 5 jobs on 2 workers: at most 2 stages at once, all terminal..." << std::endl;
    {
        Store store;
        Hub hub;
        auto recorder = std::make_shared<Recorder>();
        hub.add(recorder);
        FakeTranscoder transcoder;
        transcoder.delay = std::chrono::milliseconds(20);
        FakeModel model;
        Processor processor(store, hub, transcoder, model, workspace);

        Pool pool(2);
        assert(pool.start([&](const JobId& id, int workerId) {
            (void)processor.process(id, workerId);
        }));

        std::vector<JobId> ids;
        for (int i = 0; i < 5; ++i) {
            auto job = store.create(makeSource(root, "batch" + std::to_string(i) + ".mp3"), "", 11);
            ids.push_back(job.id);
            assert(pool.submit(job.id));
        }

        assert(pool.waitIdle(std::chrono::seconds(30)));
        pool.stop();

        assert(transcoder.maxRunning.load() <= 2);
        for (const auto& id : ids) {
            auto job = store.get(id);
            assert(job && isTerminal(job->status));
            assert(job->status == Status::Completed);
            checkMonotonic(recorder->of(id));
        }
        assert(store.countByStatus()[Status::Completed] == 5);
    }

    std::filesystem::remove_all(root);
    std::cout << "[Test] Processor tests passed." << std::endl;
    return 0;
}
