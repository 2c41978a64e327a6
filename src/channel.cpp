/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/channel.hpp"
#include "mediascribe/logger.hpp"
#include "mediascribe/serialize.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <algorithm>
#include <cstring>
#include <functional>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace mediascribe {

namespace {
constexpr std::size_t kMaxClientLine = 4096;

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string describePeer(const sockaddr_storage& addr) {
    char host[NI_MAXHOST] = {0};
    char serv[NI_MAXSERV] = {0};
    if (::getnameinfo(reinterpret_cast<const sockaddr*>(&addr), sizeof(addr), host, sizeof(host),
                      serv, sizeof(serv), NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
        return "unknown";
    }
    return std::string(host) + ":" + serv;
}
}

SocketObserver::SocketObserver(int fd, std::string peer, Framing framing, std::size_t outboxLimit) noexcept
    : fd_(fd), peer_(std::move(peer)), framing_(framing), outboxLimit_(outboxLimit) {}

SocketObserver::~SocketObserver() {
    close();
}

void SocketObserver::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (writer_.joinable()) {
        return;
    }
    writer_ = std::thread(&SocketObserver::writeLoop, this);
}

void SocketObserver::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        abandonLocked();
    }
    if (writer_.joinable() && writer_.get_id() != std::this_thread::get_id()) {
        writer_.join();
    }
}

bool SocketObserver::deliver(const JobSnapshot& snapshot) {
    std::string bytes = frame(dumpLine(toJson(snapshot)));

    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_.load()) {
        return false;
    }

    const int rank = static_cast<int>(snapshot.status);
    auto it = seen_.find(snapshot.id);
    if (it != seen_.end()) {
        const auto& [seenRank, seenProgress] = it->second;
        if (rank < seenRank || (rank == seenRank && snapshot.progress < seenProgress)) {
            return true;
        }
    }
    seen_[snapshot.id] = {rank, snapshot.progress};

    return enqueueLocked(std::move(bytes));
}

bool SocketObserver::sendLine(const std::string& line) {
    return sendRaw(frame(line));
}

bool SocketObserver::sendRaw(std::string bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_.load()) {
        return false;
    }
    return enqueueLocked(std::move(bytes));
}

std::string SocketObserver::frame(const std::string& line) const {
    if (framing_ == Framing::WebSocket) {
        return ws::encodeFrame(ws::Opcode::Text, line);
    }
    return line + "\n";
}

std::size_t SocketObserver::pending() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return outbox_.size() + (sending_ ? 1 : 0);
}

bool SocketObserver::enqueueLocked(std::string bytes) {
    if (outbox_.size() >= outboxLimit_) {
        LOG_WARN("Live client " + peer_ + " is not reading, " + std::to_string(outbox_.size()) +
                 " updates pending; dropping it");
        abandonLocked();
        return false;
    }
    outbox_.push_back(std::move(bytes));
    cv_.notify_one();
    return true;
}

void SocketObserver::abandonLocked() noexcept {
    if (!open_.exchange(false)) {
        return;
    }
    outbox_.clear();
    // Unblocks a writer stuck in send() and the connection's reader
    ::shutdown(fd_, SHUT_RDWR);
    cv_.notify_all();
}

void SocketObserver::writeLoop() noexcept {
    setThreadName("LiveOut");

    while (true) {
        std::string data;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !open_.load() || !outbox_.empty(); });
            if (!open_.load()) {
                return;
            }
            data = std::move(outbox_.front());
            outbox_.pop_front();
            sending_ = true;
        }
        bool ok = sendAll(data);

        std::lock_guard<std::mutex> lock(mutex_);
        sending_ = false;
        if (!ok) {
            abandonLocked();
            return;
        }
    }
}

bool SocketObserver::sendAll(const std::string& data) noexcept {
    std::size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (open_.load()) {
                LOG_DEBUG("Send to " + peer_ + " failed: " + std::strerror(errno));
            }
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

LiveChannel::LiveChannel(Hub& hub, const Store& store, std::string host, int port,
                         std::chrono::seconds heartbeat) noexcept
    : hub_(hub), store_(store), host_(std::move(host)), port_(port), heartbeat_(heartbeat) {}

LiveChannel::~LiveChannel() {
    stop();
}

bool LiveChannel::start() {
    if (running_.load()) {
        LOG_WARN("Live channel already running");
        return false;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    addrinfo* res = nullptr;
    std::string service = std::to_string(port_);
    int rc = ::getaddrinfo(host_.empty() ? nullptr : host_.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        LOG_ERROR("Live channel cannot resolve " + host_ + ": " + ::gai_strerror(rc));
        return false;
    }

    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }
        int one = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, SOMAXCONN) == 0) {
            listenFd_ = fd;
            break;
        }
        ::close(fd);
    }
    ::freeaddrinfo(res);

    if (listenFd_ < 0) {
        LOG_ERROR("Live channel cannot listen on " + host_ + ":" + service + ": " + std::strerror(errno));
        return false;
    }

    sockaddr_storage bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        if (bound.ss_family == AF_INET) {
            port_ = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
        } else if (bound.ss_family == AF_INET6) {
            port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
        }
    }

    stopping_.store(false);
    running_.store(true);
    acceptThread_ = std::thread(&LiveChannel::acceptLoop, this);

    LOG_INFO("Live channel listening on " + host_ + ":" + std::to_string(port_));
    return true;
}

void LiveChannel::stop() noexcept {
    if (!running_.exchange(false)) {
        return;
    }
    stopping_.store(true);

    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    if (listenFd_ >= 0) {
        ::close(listenFd_);
        listenFd_ = -1;
    }

    std::list<std::unique_ptr<Connection>> connections;
    {
        std::lock_guard<std::mutex> lock(connMutex_);
        for (auto& conn : connections_) {
            if (conn->fd >= 0) {
                ::shutdown(conn->fd, SHUT_RDWR);
            }
        }
        connections.swap(connections_);
    }
    for (auto& conn : connections) {
        if (conn->worker.joinable()) {
            conn->worker.join();
        }
    }

    LOG_INFO("Live channel stopped");
}

std::size_t LiveChannel::connectionCount() const noexcept {
    std::lock_guard<std::mutex> lock(connMutex_);
    std::size_t n = 0;
    for (const auto& conn : connections_) {
        if (!conn->done.load()) {
            ++n;
        }
    }
    return n;
}

void LiveChannel::acceptLoop() {
    setThreadName("Live");

    while (!stopping_.load()) {
        pollfd pfd{listenFd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, 200);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("Live channel poll failed: " + std::string(std::strerror(errno)));
            break;
        }
        reapFinished();
        if (rc == 0) {
            continue;
        }

        sockaddr_storage addr{};
        socklen_t len = sizeof(addr);
        int fd = ::accept4(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len, SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                LOG_WARN("Live channel accept failed: " + std::string(std::strerror(errno)));
            }
            continue;
        }

        // Bounds how long a writer waits on a client that stopped reading
        timeval timeout{5, 0};
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

        try {
            auto conn = std::make_unique<Connection>();
            conn->fd = fd;
            conn->peer = describePeer(addr);
            Connection& ref = *conn;

            std::lock_guard<std::mutex> lock(connMutex_);
            connections_.push_back(std::move(conn));
            try {
                ref.worker = std::thread(&LiveChannel::serve, this, std::ref(ref));
            } catch (...) {
                connections_.pop_back();
                throw;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to start live client: " + std::string(e.what()));
            ::close(fd);
        }
    }
}

void LiveChannel::serve(Connection& conn) noexcept {
    setThreadName("Live-" + std::to_string(conn.fd));

    std::shared_ptr<SocketObserver> observer;
    ObserverId observerId = 0;
    try {
        Opening opening = negotiate(conn);
        if (opening.ok && !stopping_.load()) {
            observer = std::make_shared<SocketObserver>(conn.fd, conn.peer, opening.framing);
            observer->start();
            observerId = hub_.add(observer);
            LOG_INFO("Live client connected: " + conn.peer +
                     (opening.framing == Framing::WebSocket ? " (websocket)" : ""));

            for (const auto& job : store_.list()) {
                if (!hub_.deliverTo(observerId, job)) {
                    break;
                }
            }

            if (opening.framing == Framing::WebSocket) {
                readFrames(conn, *observer, opening.pending);
            } else {
                readLines(conn, *observer, std::move(opening.pending));
            }
        }
    } catch (const std::exception& e) {
        LOG_WARN("Live client " + conn.peer + " error: " + std::string(e.what()));
    }

    if (observerId != 0) {
        (void)hub_.remove(observerId);
    }
    if (observer) {
        observer->close();
        LOG_INFO("Live client disconnected: " + conn.peer);
    }
    finish(conn);
}

LiveChannel::Opening LiveChannel::negotiate(Connection& conn) {
    // A websocket client speaks first; a line client may stay silent
    constexpr auto kSniffWindow = std::chrono::milliseconds(250);
    constexpr auto kHandshakeTimeout = std::chrono::seconds(5);
    constexpr std::size_t kMaxHandshake = 8192;

    Opening opening;
    const auto begin = std::chrono::steady_clock::now();
    bool handshake = false;
    char chunk[1024];

    while (!stopping_.load()) {
        if (!handshake && opening.pending.size() >= 4) {
            handshake = opening.pending.compare(0, 4, "GET ") == 0;
            if (!handshake) {
                return opening;
            }
        }
        if (handshake && opening.pending.find("\r\n\r\n") != std::string::npos) {
            break;
        }

        const auto elapsed = std::chrono::steady_clock::now() - begin;
        const auto limit = handshake ? std::chrono::duration_cast<std::chrono::steady_clock::duration>(kHandshakeTimeout)
                                     : std::chrono::duration_cast<std::chrono::steady_clock::duration>(kSniffWindow);
        if (elapsed >= limit) {
            if (handshake) {
                LOG_WARN("Live client " + conn.peer + " sent an incomplete handshake");
                opening.ok = false;
            }
            return opening;
        }

        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(limit - elapsed);
        pollfd pfd{conn.fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(std::max<long long>(1, left.count())));
        if (rc < 0 && errno != EINTR) {
            opening.ok = false;
            return opening;
        }
        if (rc <= 0) {
            continue;
        }
        ssize_t n = ::recv(conn.fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            opening.ok = false;
            return opening;
        }
        opening.pending.append(chunk, static_cast<std::size_t>(n));
        if (opening.pending.size() > kMaxHandshake) {
            opening.ok = false;
            return opening;
        }
    }
    if (stopping_.load()) {
        opening.ok = false;
        return opening;
    }

    const auto end = opening.pending.find("\r\n\r\n");
    std::string head = opening.pending.substr(0, end + 4);
    opening.pending.erase(0, end + 4);

    std::string response;
    auto request = ws::parseUpgradeRequest(head);
    if (!request) {
        response = ws::rejectResponse(400, "Bad Request");
    } else if (request->path != kWebSocketPath) {
        response = ws::rejectResponse(404, "Not Found");
    } else {
        response = ws::handshakeResponse(request->key);
        opening.framing = Framing::WebSocket;
    }

    std::size_t sent = 0;
    while (sent < response.size()) {
        ssize_t n = ::send(conn.fd, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            opening.ok = false;
            return opening;
        }
        sent += static_cast<std::size_t>(n);
    }

    if (opening.framing != Framing::WebSocket) {
        LOG_DEBUG("Rejected live client " + conn.peer + ": " + response.substr(0, response.find('\r')));
        opening.ok = false;
    }
    return opening;
}

namespace {

// Client silence is only reported; it never stops delivery
class SilenceWatch {
public:
    SilenceWatch(std::string peer, std::chrono::seconds window)
        : peer_(std::move(peer)), window_(window), lastSeen_(std::chrono::steady_clock::now()) {}

    void heard() noexcept {
        lastSeen_ = std::chrono::steady_clock::now();
        silent_ = false;
    }

    void check() {
        if (!silent_ && std::chrono::steady_clock::now() - lastSeen_ > window_) {
            LOG_INFO("No heartbeat from " + peer_ + " for " + std::to_string(window_.count()) + "s");
            silent_ = true;
        }
    }

private:
    std::string peer_;
    std::chrono::seconds window_;
    std::chrono::steady_clock::time_point lastSeen_;
    bool silent_ = false;
};

// Waits for readable data; returns bytes read, 0 on timeout, -1 when the
// connection is gone
ssize_t receiveSome(int fd, char* chunk, std::size_t size) {
    pollfd pfd{fd, POLLIN, 0};
    int rc = ::poll(&pfd, 1, 500);
    if (rc < 0) {
        return errno == EINTR ? 0 : -1;
    }
    if (rc == 0) {
        return 0;
    }
    ssize_t n = ::recv(fd, chunk, size, 0);
    if (n < 0 && errno == EINTR) {
        return 0;
    }
    return n <= 0 ? -1 : n;
}

}

void LiveChannel::readLines(Connection& conn, SocketObserver& observer, std::string buffer) {
    SilenceWatch watch(conn.peer, heartbeat_);
    char chunk[1024];

    while (!stopping_.load() && observer.isOpen()) {
        std::size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            std::string line = trim(buffer.substr(0, pos));
            buffer.erase(0, pos + 1);
            if (line == "ping" && !observer.sendLine("pong")) {
                return;
            }
        }
        if (buffer.size() > kMaxClientLine) {
            buffer.clear();
        }

        ssize_t n = receiveSome(conn.fd, chunk, sizeof(chunk));
        if (n < 0) {
            return;
        }
        if (n == 0) {
            watch.check();
            continue;
        }
        watch.heard();
        buffer.append(chunk, static_cast<std::size_t>(n));
    }
}

void LiveChannel::readFrames(Connection& conn, SocketObserver& observer, const std::string& pending) {
    SilenceWatch watch(conn.peer, heartbeat_);
    ws::FrameReader reader;
    reader.feed(pending.data(), pending.size());
    char chunk[1024];

    while (!stopping_.load() && observer.isOpen()) {
        while (auto frame = reader.next()) {
            switch (frame->opcode) {
                case ws::Opcode::Text:
                    if (trim(frame->payload) == "ping" && !observer.sendLine("pong")) {
                        return;
                    }
                    break;
                case ws::Opcode::Ping:
                    if (!observer.sendRaw(ws::encodeFrame(ws::Opcode::Pong, frame->payload))) {
                        return;
                    }
                    break;
                case ws::Opcode::Close: {
                    // Echo the close and give the writer a moment to flush it
                    std::string code = frame->payload.substr(0, 2);
                    if (observer.sendRaw(ws::encodeFrame(ws::Opcode::Close, code))) {
                        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
                        while (observer.pending() > 0 && std::chrono::steady_clock::now() < deadline) {
                            std::this_thread::sleep_for(std::chrono::milliseconds(10));
                        }
                    }
                    return;
                }
                default:
                    break;
            }
        }

        ssize_t n = receiveSome(conn.fd, chunk, sizeof(chunk));
        if (n < 0) {
            return;
        }
        if (n == 0) {
            watch.check();
            continue;
        }
        watch.heard();
        reader.feed(chunk, static_cast<std::size_t>(n));
    }
}

void LiveChannel::finish(Connection& conn) noexcept {
    std::lock_guard<std::mutex> lock(connMutex_);
    ::close(conn.fd);
    conn.fd = -1;
    conn.done.store(true);
}

void LiveChannel::reapFinished() {
    std::list<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(connMutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if ((*it)->done.load()) {
                finished.push_back(std::move(*it));
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& conn : finished) {
        if (conn->worker.joinable()) {
            conn->worker.join();
        }
    }
}

}
