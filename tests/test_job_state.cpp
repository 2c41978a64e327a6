/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "mediascribe/store.hpp"

using namespace mediascribe;

namespace {
template <typename Fn>
bool throwsInternal(Fn fn) {
    try {
        fn();
    } catch (const InternalError&) {
        return true;
    }
    return false;
}
}

int main() {
    std::cout << "[Test] Allowed transitions..." << std::endl;
    {
        assert(canTransition(Status::Queued, Status::Stage1Running));
        assert(canTransition(Status::Stage1Running, Status::Stage2Running));
        assert(canTransition(Status::Stage1Running, Status::Failed));
        assert(canTransition(Status::Stage2Running, Status::Completed));
        assert(canTransition(Status::Stage2Running, Status::Failed));

        assert(!canTransition(Status::Queued, Status::Stage2Running));
        assert(!canTransition(Status::Queued, Status::Completed));
        assert(!canTransition(Status::Stage1Running, Status::Completed));
        assert(!canTransition(Status::Completed, Status::Failed));
        assert(!canTransition(Status::Failed, Status::Queued));
    }

    std::cout << "[Test] Job lifecycle..." << std::endl;
    {
        Job job;
        job.id = "j1";
        assert(job.status == Status::Queued);
        assert(!job.completedAt);

        transition(job, Status::Stage1Running);
        recordProgress(job, 10.0, "Extracting audio", "10%");
        recordProgress(job, 5.0, "Extracting audio", "stale");
        assert(job.progress == 10.0);
        assert(job.message == "stale");
        recordProgress(job, 150.0, "Extracting audio", "overflow");
        assert(job.progress == 100.0);

        transition(job, Status::Stage2Running);
        transition(job, Status::Completed);
        assert(job.completedAt);

        assert(throwsInternal([&] { transition(job, Status::Failed); }));
        assert(throwsInternal([&] { recordProgress(job, 100.0, "x", "y"); }));
    }

    std::cout << "[Test] markFailed..." << std::endl;
    {
        Job job;
        transition(job, Status::Stage1Running);
        markFailed(job, ErrorKind::Transcode, "Audio extraction failed");
        assert(job.status == Status::Failed);
        assert(job.errorKind == ErrorKind::Transcode);
        assert(job.errorDetail == "Audio extraction failed");
        assert(job.stageLabel == "Failed");
        assert(job.completedAt);

        Job queued;
        assert(throwsInternal([&] { markFailed(queued, ErrorKind::Internal, "x"); }));
    }

    std::cout << "[Test] Wire names..." << std::endl;
    {
        assert(std::string(toString(Status::Stage1Running)) == "extracting_audio");
        assert(std::string(toString(Status::Stage2Running)) == "transcribing");
        assert(parseStatus("completed") == Status::Completed);
        assert(!parseStatus("done"));
        assert(std::string(toString(ErrorKind::Transcode)) == "TranscodeError");
        assert(isTerminal(Status::Failed) && !isTerminal(Status::Stage2Running));
        assert(isRunning(Status::Stage1Running) && !isRunning(Status::Queued));
    }

    std::cout << "[Test] Store hands out copies..." << std::endl;
    {
        Store store;
        auto a = store.create("/tmp/a.mp4", "", 10);
        auto b = store.create("/tmp/b.mp4", "talk.mp4", 20);
        assert(a.id != b.id);
        assert(a.fileName == "a.mp4");
        assert(b.fileName == "talk.mp4");
        assert(a.status == Status::Queued && a.progress == 0.0);

        auto list = store.list();
        assert(list.size() == 2 && list[0].id == a.id && list[1].id == b.id);

        list[0].progress = 99.0;
        assert(store.get(a.id)->progress == 0.0);

        auto updated = store.mutate(a.id, [](Job& j) { transition(j, Status::Stage1Running); });
        assert(updated.status == Status::Stage1Running);
        assert(store.get(a.id)->status == Status::Stage1Running);

        // A throwing mutation leaves the stored job as it was
        assert(throwsInternal([&] {
            store.mutate(a.id, [](Job& j) {
                j.progress = 42.0;
                transition(j, Status::Completed);
            });
        }));
        assert(store.get(a.id)->progress == 0.0);

        assert(throwsInternal([&] { store.mutate("missing", [](Job&) {}); }));
        assert(!store.get("missing"));

        auto counts = store.countByStatus();
        assert(counts.size() == 5);
        assert(counts[Status::Queued] == 1);
        assert(counts[Status::Stage1Running] == 1);
        assert(counts[Status::Completed] == 0);
    }

    std::cout << "[Test] Concurrent creation yields unique ids..." << std::endl;
    {
        Store store;
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&store]() {
                for (int i = 0; i < 100; ++i) {
                    (void)store.create("/tmp/x.wav", "x.wav", 1);
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        assert(store.size() == 800);
        assert(store.list().size() == 800);
    }

    std::cout << "[Test] Job state tests passed." << std::endl;
    return 0;
}
