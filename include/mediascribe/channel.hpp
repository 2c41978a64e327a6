/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "mediascribe/hub.hpp"
#include "mediascribe/store.hpp"
#include "mediascribe/websocket.hpp"

namespace mediascribe {

// How snapshots are framed on the wire.
enum class Framing { Lines, WebSocket };

// Observer writing JSON snapshots to a socket, one per line or one per
// websocket text frame. deliver() only queues the message; a writer thread
// owned by the observer drains the queue, so a slow client never holds up
// the publishing worker. A client whose queue overflows is dropped.
// Snapshots older than what this client has already seen for a job are
// skipped, so a replay racing with a live publish never shows progress
// going backwards.
class SocketObserver final : public Observer {
public:
    static constexpr std::size_t kDefaultOutboxLimit = 1024;

    SocketObserver(int fd, std::string peer, Framing framing = Framing::Lines,
                   std::size_t outboxLimit = kDefaultOutboxLimit) noexcept;
    ~SocketObserver() override;

    SocketObserver(const SocketObserver&) = delete;
    SocketObserver& operator=(const SocketObserver&) = delete;

    bool deliver(const JobSnapshot& snapshot) override;
    [[nodiscard]] std::string describe() const override { return peer_; }

    void start();
    // Stops the writer and shuts the socket down. The fd itself stays open.
    void close() noexcept;

    // Queues one message, framed like snapshots.
    bool sendLine(const std::string& line);
    // Queues bytes that are already framed.
    bool sendRaw(std::string bytes);
    [[nodiscard]] bool isOpen() const noexcept { return open_.load(); }
    // Messages queued or being written.
    [[nodiscard]] std::size_t pending() const noexcept;

private:
    bool enqueueLocked(std::string bytes);
    [[nodiscard]] std::string frame(const std::string& line) const;
    void abandonLocked() noexcept;
    void writeLoop() noexcept;
    bool sendAll(const std::string& data) noexcept;

    int fd_;
    std::string peer_;
    Framing framing_;
    std::size_t outboxLimit_;
    std::atomic<bool> open_{true};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> outbox_;
    bool sending_ = false;
    std::unordered_map<JobId, std::pair<int, double>> seen_;
    std::thread writer_;
};

// The live update endpoint. Clients receive every job snapshot, starting
// with the current state of all jobs. Two transports share the port:
// a websocket upgrade on /ws gets one JSON text frame per snapshot, any
// other client gets newline-delimited JSON. A client message "ping" is
// answered with "pong"; anything else is ignored.
class LiveChannel final {
public:
    static constexpr const char* kWebSocketPath = "/ws";

    LiveChannel(Hub& hub, const Store& store, std::string host, int port,
                std::chrono::seconds heartbeat = std::chrono::seconds(30)) noexcept;
    ~LiveChannel();

    LiveChannel(const LiveChannel&) = delete;
    LiveChannel& operator=(const LiveChannel&) = delete;
    LiveChannel(LiveChannel&&) = delete;
    LiveChannel& operator=(LiveChannel&&) = delete;

    [[nodiscard]] bool start();
    void stop() noexcept;

    // Bound port, useful when constructed with port 0.
    [[nodiscard]] int port() const noexcept { return port_; }
    [[nodiscard]] std::size_t connectionCount() const noexcept;

private:
    struct Connection {
        int fd = -1;
        std::string peer;
        std::thread worker;
        std::atomic<bool> done{false};
    };

    // Bytes read before the transport was known, plus what it turned out to be
    struct Opening {
        Framing framing = Framing::Lines;
        std::string pending;
        bool ok = true;
    };

    void acceptLoop();
    void serve(Connection& conn) noexcept;
    Opening negotiate(Connection& conn);
    void readLines(Connection& conn, SocketObserver& observer, std::string buffer);
    void readFrames(Connection& conn, SocketObserver& observer, const std::string& pending);
    void finish(Connection& conn) noexcept;
    void reapFinished();

    Hub& hub_;
    const Store& store_;
    std::string host_;
    int port_;
    std::chrono::seconds heartbeat_;

    int listenFd_ = -1;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::thread acceptThread_;

    mutable std::mutex connMutex_;
    std::list<std::unique_ptr<Connection>> connections_;
};

}
