/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/api.hpp"
#include "mediascribe/logger.hpp"
#include "mediascribe/serialize.hpp"
#include <httplib.h>

namespace mediascribe {

namespace {
void sendJson(httplib::Response& res, const json& body, int status = 200) {
    res.status = status;
    res.set_content(dumpLine(body), "application/json");
}

void sendError(httplib::Response& res, int status, const std::string& detail) {
    sendJson(res, json{{"detail", detail}}, status);
}

int submissionStatus(SubmissionError error) {
    switch (error) {
        case SubmissionError::InvalidContent: return 400;
        case SubmissionError::Unavailable: return 503;
        case SubmissionError::IoError:
        default: return 500;
    }
}
}

HttpApi::HttpApi(Work& work, const Flow& flow, std::string host, int port)
    : work_(work), flow_(flow), host_(std::move(host)), port_(port),
      server_(std::make_unique<httplib::Server>()) {
    routes();
}

HttpApi::~HttpApi() {
    stop();
}

void HttpApi::routes() {
    server_->Get("/api/jobs", [this](const httplib::Request&, httplib::Response& res) {
        json jobs = json::array();
        for (const auto& job : flow_.list()) {
            jobs.push_back(toJson(job));
        }
        sendJson(res, jobs);
    });

    server_->Get(R"(/api/jobs/([A-Za-z0-9_\-]+))", [this](const httplib::Request& req, httplib::Response& res) {
        auto job = flow_.get(req.matches[1]);
        if (!job) {
            sendError(res, 404, "Job not found");
            return;
        }
        sendJson(res, toJson(*job));
    });

    server_->Post("/api/jobs", [this](const httplib::Request& req, httplib::Response& res) {
        json body;
        try {
            body = json::parse(req.body);
        } catch (const json::parse_error& e) {
            sendError(res, 400, std::string("Invalid JSON: ") + e.what());
            return;
        }

        if (!body.is_object() || !body.contains("path") || !body["path"].is_string()) {
            sendError(res, 400, "Missing \"path\"");
            return;
        }
        std::string name = body.value("name", std::string());

        SubmitResult result = work_.submit(body["path"].get<std::string>(), name);
        if (!result) {
            sendError(res, submissionStatus(result.error), result.message);
            return;
        }
        sendJson(res, toJson(*result.job), 201);
    });

    server_->Get(R"(/api/download/([A-Za-z0-9_\-]+))", [this](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        auto job = flow_.get(id);
        if (!job) {
            sendError(res, 404, "Job not found");
            return;
        }
        auto text = flow_.result(id);
        if (!text) {
            sendError(res, 404, "Transcript not available");
            return;
        }

        std::string stem = std::filesystem::path(job->fileName).stem().string();
        res.set_header("Content-Disposition", "attachment; filename=\"" + (stem.empty() ? id : stem) + "_transcript.txt\"");
        res.set_content(*text, "text/plain; charset=utf-8");
    });

    server_->Get("/api/status", [this](const httplib::Request&, httplib::Response& res) {
        sendJson(res, toJson(flow_.status()));
    });

    server_->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "Unknown Exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
        }
        LOG_ERROR("HTTP " + req.method + " " + req.path + " failed: " + what);
        sendError(res, 500, "Internal server error");
    });

    server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LOG_DEBUG("HTTP " + req.method + " " + req.path + " -> " + std::to_string(res.status));
    });
}

bool HttpApi::start() {
    if (running_.load()) {
        LOG_WARN("HTTP API already running");
        return false;
    }

    if (port_ == 0) {
        port_ = server_->bind_to_any_port(host_);
        if (port_ <= 0) {
            LOG_ERROR("HTTP API cannot bind to " + host_);
            return false;
        }
    } else if (!server_->bind_to_port(host_, port_)) {
        LOG_ERROR("HTTP API cannot bind to " + host_ + ":" + std::to_string(port_));
        return false;
    }

    running_.store(true);
    thread_ = std::thread([this]() {
        setThreadName("Http");
        if (!server_->listen_after_bind()) {
            LOG_ERROR("HTTP API listener exited with an error");
        }
    });

    LOG_INFO("HTTP API listening on http://" + host_ + ":" + std::to_string(port_));
    return true;
}

void HttpApi::stop() noexcept {
    if (!running_.exchange(false)) {
        return;
    }
    server_->stop();
    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("HTTP API stopped");
}

}
