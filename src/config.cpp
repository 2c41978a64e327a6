/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/config.hpp"
#include "mediascribe/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <thread>

namespace mediascribe {

namespace {
int env_int(const char* name, int defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

double env_double(const char* name, double defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

std::string env_string(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : defv;
}

bool env_bool(const char* name, bool defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    std::string s(val);
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}
}

Config Config::fromEnv() {
    Config c;
    c.workers = env_int("MEDIASCRIBE_WORKERS", c.workers);
    c.modelPath = env_string("MEDIASCRIBE_MODEL", c.modelPath);
    c.storage = env_string("MEDIASCRIBE_STORAGE", c.storage.string());
    c.host = env_string("MEDIASCRIBE_HOST", c.host);
    c.httpPort = env_int("MEDIASCRIBE_HTTP_PORT", c.httpPort);
    c.livePort = env_int("MEDIASCRIBE_LIVE_PORT", c.livePort);
    c.ffmpeg = env_string("MEDIASCRIBE_FFMPEG", c.ffmpeg);
    c.ffprobe = env_string("MEDIASCRIBE_FFPROBE", c.ffprobe);
    c.useGpu = env_bool("MEDIASCRIBE_USE_GPU", c.useGpu);
    c.threads = env_int("MEDIASCRIBE_THREADS", c.threads);
    c.language = env_string("MEDIASCRIBE_LANGUAGE", c.language);
    c.segmentSeconds = env_double("MEDIASCRIBE_SEGMENT_SECONDS", c.segmentSeconds);
    c.heartbeatSeconds = env_int("MEDIASCRIBE_HEARTBEAT_SECONDS", c.heartbeatSeconds);
    return c;
}

int Config::decodeThreads() const noexcept {
    if (threads > 0) {
        return threads;
    }
    int hw = static_cast<int>(std::thread::hardware_concurrency());
    return std::max(1, hw / std::max(1, workers));
}

std::string Config::validate() const {
    if (workers < 1 || workers > 64) {
        return "Worker count must be between 1 and 64";
    }
    if (httpPort < 0 || httpPort > 65535) {
        return "HTTP port out of range: " + std::to_string(httpPort);
    }
    if (livePort < 0 || livePort > 65535) {
        return "Live port out of range: " + std::to_string(livePort);
    }
    if (segmentSeconds <= 0.0) {
        return "Segment length must be positive";
    }
    if (heartbeatSeconds <= 0) {
        return "Heartbeat window must be positive";
    }
    if (modelPath.empty()) {
        return "Model path is empty";
    }
    return {};
}

}
