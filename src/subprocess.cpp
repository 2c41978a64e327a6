/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/subprocess.hpp"
#include "mediascribe/logger.hpp"
#include <cerrno>
#include <cstring>
#include <deque>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mediascribe {

namespace {

class LineSplitter {
public:
    LineSplitter(const LineCallback& cb, std::deque<std::string>& tail, std::size_t tailLines)
        : cb_(cb), tail_(tail), tailLines_(tailLines) {}

    void feed(const char* data, std::size_t len) {
        for (std::size_t i = 0; i < len; ++i) {
            char c = data[i];
            if (c == '\n' || c == '\r') {
                flush();
            } else {
                pending_.push_back(c);
            }
        }
    }

    void flush() {
        if (pending_.empty()) {
            return;
        }
        if (tailLines_ > 0) {
            tail_.push_back(pending_);
            while (tail_.size() > tailLines_) {
                tail_.pop_front();
            }
        }
        if (cb_) {
            cb_(pending_);
        }
        pending_.clear();
    }

private:
    const LineCallback& cb_;
    std::deque<std::string>& tail_;
    std::size_t tailLines_;
    std::string pending_;
};

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

}

ToolResult runTool(const std::vector<std::string>& argv,
                   const LineCallback& onStderrLine,
                   bool captureStdout,
                   std::size_t tailLines) {
    ToolResult result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    int errPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    if (::pipe2(errPipe, O_CLOEXEC) != 0 || (captureStdout && ::pipe2(outPipe, O_CLOEXEC) != 0)) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        return result;
    }

    std::vector<char*> cargs;
    cargs.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargs.push_back(const_cast<char*>(arg.c_str()));
    }
    cargs.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid == -1) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        return result;
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            if (!captureStdout) {
                ::dup2(devnull, STDOUT_FILENO);
            }
        }
        if (captureStdout) {
            ::dup2(outPipe[1], STDOUT_FILENO);
        }
        ::dup2(errPipe[1], STDERR_FILENO);

        ::execvp(cargs[0], cargs.data());
        // exec failed: report on the stderr pipe so the parent gets a tail
        const char* msg = "exec failed: ";
        (void)!::write(STDERR_FILENO, msg, std::strlen(msg));
        const char* reason = std::strerror(errno);
        (void)!::write(STDERR_FILENO, reason, std::strlen(reason));
        _exit(127);
    }

    closeFd(errPipe[1]);
    closeFd(outPipe[1]);

    std::deque<std::string> tail;
    LineSplitter splitter(onStderrLine, tail, tailLines);
    char buf[4096];

    std::vector<pollfd> fds;
    fds.push_back({errPipe[0], POLLIN, 0});
    if (captureStdout) {
        fds.push_back({outPipe[0], POLLIN, 0});
    }

    while (!fds.empty()) {
        int rc = ::poll(fds.data(), fds.size(), -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error = std::string("poll failed: ") + std::strerror(errno);
            break;
        }

        for (auto it = fds.begin(); it != fds.end();) {
            if (it->revents == 0) {
                ++it;
                continue;
            }
            ssize_t n = ::read(it->fd, buf, sizeof(buf));
            if (n > 0) {
                if (it->fd == errPipe[0]) {
                    try {
                        splitter.feed(buf, static_cast<std::size_t>(n));
                    } catch (const std::exception& e) {
                        // keep draining so the child never blocks on a full pipe
                        LOG_ERROR("Line handler failed: " + std::string(e.what()));
                        if (result.error.empty()) {
                            result.error = e.what();
                        }
                    }
                } else {
                    result.output.append(buf, static_cast<std::size_t>(n));
                }
                ++it;
            } else if (n < 0 && errno == EINTR) {
                ++it;
            } else {
                it = fds.erase(it);
            }
        }
    }
    splitter.flush();

    closeFd(errPipe[0]);
    closeFd(outPipe[0]);

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);

    if (waited == -1) {
        result.error = std::string("waitpid failed: ") + std::strerror(errno);
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.error = "terminated by signal " + std::to_string(WTERMSIG(status));
    }

    for (const auto& line : tail) {
        if (!result.tail.empty()) {
            result.tail += "\n";
        }
        result.tail += line;
    }

    result.ok = result.error.empty() && result.exitCode == 0;
    return result;
}

}
