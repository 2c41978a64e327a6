/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "mediascribe/flow.hpp"
#include "mediascribe/work.hpp"

namespace httplib {
class Server;
}

namespace mediascribe {

// JSON over HTTP for submission, queries and transcript download.
//
//   GET  /api/jobs            every job, creation order
//   GET  /api/jobs/{id}       one job
//   POST /api/jobs            {"path": "...", "name": "..."} -> job
//   GET  /api/download/{id}   transcript text, only once completed
//   GET  /api/status          worker and per-status counts
class HttpApi final {
public:
    HttpApi(Work& work, const Flow& flow, std::string host, int port);
    ~HttpApi();

    HttpApi(const HttpApi&) = delete;
    HttpApi& operator=(const HttpApi&) = delete;
    HttpApi(HttpApi&&) = delete;
    HttpApi& operator=(HttpApi&&) = delete;

    [[nodiscard]] bool start();
    void stop() noexcept;

    [[nodiscard]] int port() const noexcept { return port_; }

private:
    void routes();

    Work& work_;
    const Flow& flow_;
    std::string host_;
    int port_;

    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

}
