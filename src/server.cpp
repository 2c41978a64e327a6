/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/server.hpp"
#include "mediascribe/api.hpp"
#include "mediascribe/channel.hpp"
#include "mediascribe/logger.hpp"
#include "mediascribe/pool.hpp"
#include "mediascribe/processor.hpp"
#include "mediascribe/transcode.hpp"
#include "mediascribe/transcribe.hpp"
#include "mediascribe/work.hpp"
#include <cstdlib>
#include <stdexcept>

namespace mediascribe {

// Note: Signal handling is done by the CLI (mediascribed.cpp), not by Server class

Server::Server(Config config, std::unique_ptr<TranscodeTool> transcoder, std::unique_ptr<SpeechModel> model)
    : config_(std::move(config)), transcoder_(std::move(transcoder)), model_(std::move(model)) {
    if (!transcoder_ || !model_) {
        throw std::invalid_argument("Server needs a transcoder and a speech model");
    }

    Workspace workspace = Workspace::under(config_.storage);
    pool_ = std::make_unique<Pool>(config_.workers);
    processor_ = std::make_unique<Processor>(store_, hub_, *transcoder_, *model_, workspace, config_.segmentSeconds);
    work_ = std::make_unique<Work>(store_, hub_, *pool_, workspace);
    flow_ = std::make_unique<Flow>(store_, *pool_);

    LOG_DEBUG("Server created - storage: " + config_.storage.string() +
              ", workers: " + std::to_string(config_.workers));
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting mediascribe server...");

    try {
        Workspace::under(config_.storage).create();
        LOG_DEBUG("Workspace created: " + config_.storage.string());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace: " + std::string(e.what()));
        return false;
    }

    // Name the main thread
    setThreadName("Main");

    LOG_DEBUG("========================================");
    LOG_DEBUG("mediascribe Server Starting");
    LOG_DEBUG("========================================");
    LOG_DEBUG("Model: " + config_.modelPath);
    LOG_DEBUG("Storage: " + config_.storage.string());
    LOG_DEBUG("Workers: " + std::to_string(config_.workers));
    LOG_DEBUG("mediascribe Log Level: " + std::string(getenv("MEDIASCRIBE_LOG_LEVEL") ? getenv("MEDIASCRIBE_LOG_LEVEL") : "INFO"));
    LOG_DEBUG("whisper.cpp Log Level: " + std::string(getenv("WHISPER_LOG_LEVEL") ? getenv("WHISPER_LOG_LEVEL") : "WARN"));
    LOG_DEBUG("========================================");

    try {
        LOG_DEBUG("Starting worker pool with " + std::to_string(config_.workers) + " threads...");
        if (!pool_->start([this](const JobId& jobId, int workerId) {
            (void)processor_->process(jobId, workerId);
        })) {
            LOG_ERROR("Failed to start worker pool");
            return false;
        }

        if (config_.serveNetwork) {
            live_ = std::make_unique<LiveChannel>(hub_, store_, config_.host, config_.livePort,
                                                  std::chrono::seconds(config_.heartbeatSeconds));
            if (!live_->start()) {
                LOG_ERROR("Failed to start live channel");
                pool_->stop();
                return false;
            }

            http_ = std::make_unique<HttpApi>(*work_, *flow_, config_.host, config_.httpPort);
            if (!http_->start()) {
                LOG_ERROR("Failed to start HTTP API");
                live_->stop();
                pool_->stop();
                return false;
            }
        }

        running_.store(true);
        LOG_DEBUG("Server started successfully");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        if (live_) {
            live_->stop();
        }
        pool_->stop();
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Shutting down server...");

    // Stop intake first, then let workers finish their current job
    if (http_) {
        http_->stop();
    }
    pool_->stop();
    if (live_) {
        live_->stop();
    }

    LOG_INFO("Server shutdown complete");
}

std::optional<JobSnapshot> Server::createJob(const std::filesystem::path& sourcePath, const std::string& fileName) {
    SubmitResult result = work_->submit(sourcePath, fileName);
    if (!result) {
        LOG_WARN("Submission refused: " + result.message);
        return std::nullopt;
    }
    return result.job;
}

std::vector<JobSnapshot> Server::listJobs() const {
    return flow_->list();
}

std::optional<JobSnapshot> Server::getJob(const JobId& id) const {
    return flow_->get(id);
}

std::optional<std::string> Server::getResultArtifact(const JobId& id) const {
    return flow_->result(id);
}

StatusReport Server::status() const {
    return flow_->status();
}

bool Server::waitIdle(std::chrono::milliseconds timeout) const {
    return pool_->waitIdle(timeout);
}

int Server::httpPort() const noexcept {
    return http_ ? http_->port() : -1;
}

int Server::livePort() const noexcept {
    return live_ ? live_->port() : -1;
}

}
