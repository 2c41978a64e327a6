/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mediascribe/config.hpp"
#include "mediascribe/flow.hpp"
#include "mediascribe/hub.hpp"
#include "mediascribe/store.hpp"

namespace mediascribe {

class Pool;
class Processor;
class Work;
class TranscodeTool;
class SpeechModel;
class LiveChannel;
class HttpApi;

class Server final {
public:
    Server(Config config, std::unique_ptr<TranscodeTool> transcoder, std::unique_ptr<SpeechModel> model);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    // nullopt when the source is refused or the server is not running.
    [[nodiscard]] std::optional<JobSnapshot> createJob(const std::filesystem::path& sourcePath,
                                                       const std::string& fileName = {});
    [[nodiscard]] std::vector<JobSnapshot> listJobs() const;
    [[nodiscard]] std::optional<JobSnapshot> getJob(const JobId& id) const;
    [[nodiscard]] std::optional<std::string> getResultArtifact(const JobId& id) const;
    [[nodiscard]] StatusReport status() const;

    bool waitIdle(std::chrono::milliseconds timeout) const;

    [[nodiscard]] Hub& hub() noexcept { return hub_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] int httpPort() const noexcept;
    [[nodiscard]] int livePort() const noexcept;

private:
    Config config_;

    Store store_;
    Hub hub_;

    std::unique_ptr<TranscodeTool> transcoder_;
    std::unique_ptr<SpeechModel> model_;

    std::unique_ptr<Pool> pool_;
    std::unique_ptr<Processor> processor_;
    std::unique_ptr<Work> work_;
    std::unique_ptr<Flow> flow_;
    std::unique_ptr<LiveChannel> live_;
    std::unique_ptr<HttpApi> http_;

    std::atomic<bool> running_{false};
};

}
