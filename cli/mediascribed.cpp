/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/server.hpp"
#include "mediascribe/logger.hpp"
#include "mediascribe/transcode.hpp"
#include "mediascribe/whisper_model.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace mediascribe;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

namespace {

void printUsage() {
    std::cout << "\n";
    std::cout << "  \033[1mmediascribe\033[0m " << VERSION << "                  \033[90mmedia · transcription · pipeline\033[0m\n";
    std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
    std::cout << "\n";
    std::cout << "  mediascribed [options] [media files...]\n";
    std::cout << "\n";
    std::cout << "    -m, --model <path|name>   whisper model (MEDIASCRIBE_MODEL)\n";
    std::cout << "    -s, --storage <dir>       storage root (MEDIASCRIBE_STORAGE)\n";
    std::cout << "    -w, --workers <n>         concurrent jobs (MEDIASCRIBE_WORKERS)\n";
    std::cout << "    -t, --threads <n>         threads per decode (MEDIASCRIBE_THREADS)\n";
    std::cout << "    -l, --language <code>     spoken language or auto (MEDIASCRIBE_LANGUAGE)\n";
    std::cout << "        --host <addr>         listen address (MEDIASCRIBE_HOST)\n";
    std::cout << "        --port <n>            HTTP API port (MEDIASCRIBE_HTTP_PORT)\n";
    std::cout << "        --live-port <n>       live update port (MEDIASCRIBE_LIVE_PORT)\n";
    std::cout << "        --no-gpu              never use the accelerator\n";
    std::cout << "        --once                transcribe the given files and exit\n";
    std::cout << "    -h, --help                this help\n";
    std::cout << "    -v, --version             print version\n";
    std::cout << "\n";
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Accepts a path, or a short name like "base.en" looked up as
// models/ggml-<name>.bin next to the binary or in the working directory.
std::optional<std::filesystem::path> resolveModelPath(const std::string& model, const char* argv0) {
    std::filesystem::path direct(model);
    if (std::filesystem::exists(direct)) {
        return direct;
    }

    std::vector<std::filesystem::path> dirs;
    std::filesystem::path exePath(argv0 ? argv0 : "");
    if (!exePath.empty()) {
        std::error_code ec;
        auto base = std::filesystem::absolute(exePath, ec).parent_path();
        if (!ec) {
            dirs.push_back(base / "models");
            dirs.push_back(base.parent_path() / "models");
        }
    }
    dirs.push_back(std::filesystem::current_path() / "models");

    std::string needle = toLower(direct.filename().string());
    for (const auto& dir : dirs) {
        for (const auto& candidate : {dir / ("ggml-" + needle + ".bin"), dir / needle}) {
            if (std::filesystem::exists(candidate)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

bool parseInt(const std::string& text, int& out) {
    try {
        std::size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

int runOnce(Server& server, const std::vector<std::string>& files) {
    std::vector<JobId> ids;
    for (const auto& file : files) {
        auto job = server.createJob(file);
        if (!job) {
            std::cerr << "  \033[31mrefused\033[0m  " << file << "\n";
            continue;
        }
        ids.push_back(job->id);
    }

    bool allCompleted = ids.size() == files.size();
    std::vector<bool> reported(ids.size(), false);
    std::size_t remaining = ids.size();

    while (remaining > 0 && !g_shutdown_requested) {
        for (std::size_t i = 0; i < ids.size(); ++i) {
            if (reported[i]) {
                continue;
            }
            auto job = server.getJob(ids[i]);
            if (!job || !isTerminal(job->status)) {
                continue;
            }
            reported[i] = true;
            --remaining;
            if (job->status == Status::Completed) {
                std::cout << "  " << job->fileName << "  ->  " << job->resultRef.string() << "\n";
            } else {
                allCompleted = false;
                std::cout << "  " << job->fileName << "  failed: " << job->errorDetail << "\n";
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    return (allCompleted && remaining == 0) ? 0 : 1;
}

}

int main(int argc, char* argv[]) {
    // Handle --help and --version before anything else
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    Logger::initFromEnv();
    Config config = Config::fromEnv();
    bool once = false;
    std::vector<std::string> files;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << flag << " needs a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };
        auto intFlag = [&](const char* flag, int& out) -> bool {
            auto value = needValue(flag);
            if (!value || !parseInt(*value, out)) {
                std::cerr << "Error: Invalid value for " << flag << "\n";
                return false;
            }
            return true;
        };

        if (arg == "-m" || arg == "--model") {
            auto value = needValue("--model");
            if (!value) return 1;
            config.modelPath = *value;
        } else if (arg == "-s" || arg == "--storage") {
            auto value = needValue("--storage");
            if (!value) return 1;
            config.storage = *value;
        } else if (arg == "-w" || arg == "--workers") {
            if (!intFlag("--workers", config.workers)) return 1;
        } else if (arg == "-t" || arg == "--threads") {
            if (!intFlag("--threads", config.threads)) return 1;
        } else if (arg == "-l" || arg == "--language") {
            auto value = needValue("--language");
            if (!value) return 1;
            config.language = *value;
        } else if (arg == "--host") {
            auto value = needValue("--host");
            if (!value) return 1;
            config.host = *value;
        } else if (arg == "--port") {
            if (!intFlag("--port", config.httpPort)) return 1;
        } else if (arg == "--live-port") {
            if (!intFlag("--live-port", config.livePort)) return 1;
        } else if (arg == "--no-gpu") {
            config.useGpu = false;
        } else if (arg == "--once") {
            once = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << "\n";
            return 1;
        } else {
            files.push_back(arg);
        }
    }

    if (once) {
        if (files.empty()) {
            std::cerr << "Error: --once needs at least one media file\n";
            return 1;
        }
        config.serveNetwork = false;
    }

    if (std::string problem = config.validate(); !problem.empty()) {
        std::cerr << "Error: " << problem << "\n";
        return 1;
    }

    auto resolved = resolveModelPath(config.modelPath, argv[0]);
    if (!resolved) {
        std::cerr << "Error: Model not found: " << config.modelPath << "\n";
        return 1;
    }
    config.modelPath = resolved->string();

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string modelName = std::filesystem::path(config.modelPath).filename().string();
    std::cout << "\n";
    std::cout << "  \033[1mmediascribe\033[0m " << VERSION << "                  \033[90mmedia · transcription · pipeline\033[0m\n";
    std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
    std::cout << "\n";
    std::cout << "  Loading " << modelName << "\n" << std::flush;

    try {
        WhisperOptions whisper;
        whisper.useGpu = config.useGpu;
        whisper.threads = config.decodeThreads();
        whisper.language = config.language;

        auto model = std::make_unique<WhisperModel>(config.modelPath, whisper);
        bool accelerated = model->hasAccelerator();

        auto server = std::make_unique<Server>(
            config,
            std::make_unique<FfmpegTool>(config.ffmpeg, config.ffprobe),
            std::move(model));

        if (!server->start()) {
            std::cout << "  \033[31mFailed to start\033[0m\n";
            return 1;
        }

        if (once) {
            int rc = runOnce(*server, files);
            server->shutdown();
            return rc;
        }

        std::filesystem::path pidPath = config.storage / ".mediascribed.pid";
        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            }
        }

        for (const auto& file : files) {
            if (!server->createJob(file)) {
                std::cerr << "  \033[31mrefused\033[0m  " << file << "\n";
            }
        }

        std::cout << "\n";
        std::cout << "  \033[1mRUNNING\033[0m\n\n";
        std::cout << "    Model      " << modelName << "\n";
        std::cout << "    Workers    " << config.workers << "\n";
        std::cout << "    Decode     " << (accelerated ? "gpu + cpu" : "cpu") << ", " << whisper.threads << " threads\n";
        std::cout << "    Storage    " << config.storage.string() << "\n";
        std::cout << "    HTTP       http://" << config.host << ":" << server->httpPort() << "/api/jobs\n";
        std::cout << "    Live       " << config.host << ":" << server->livePort() << "\n";
        std::cout << "\n";
        std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
        std::cout << "\n";

        while (!g_shutdown_requested && server->isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, stopping server..." << std::endl;
        }
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }
        server->shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("mediascribe daemon stopped");
    return 0;
}
