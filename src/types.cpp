/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/types.hpp"
#include <cctype>
#include <optional>
#include <vector>

namespace mediascribe {

namespace {

bool looksLikePath(const std::string& token) {
    if (token.empty()) {
        return false;
    }
    if (token[0] == '/' || token[0] == '~') {
        return true;
    }
    if (token.rfind("./", 0) == 0 || token.rfind("../", 0) == 0) {
        return true;
    }
    // relative path with a directory part, e.g. storage/audio/x.wav
    auto slash = token.find('/');
    return slash != std::string::npos && slash > 0 && slash + 1 < token.size();
}

bool isWrap(char c) noexcept {
    return c == '\'' || c == '"' || c == '(' || c == ')' || c == '[' || c == ']' ||
           c == ',' || c == ':' || c == ';';
}

struct Token {
    std::string text;
    bool newlineBefore = false;
};

std::vector<Token> tokenize(const std::string& message) {
    std::vector<Token> tokens;
    bool newline = false;
    std::size_t i = 0;
    while (i < message.size()) {
        if (std::isspace(static_cast<unsigned char>(message[i]))) {
            newline = newline || message[i] == '\n';
            ++i;
            continue;
        }
        std::size_t j = i;
        while (j < message.size() && !std::isspace(static_cast<unsigned char>(message[j]))) {
            ++j;
        }
        tokens.push_back({message.substr(i, j - i), newline});
        newline = false;
        i = j;
    }
    return tokens;
}

// If token starts a path, returns the quote it opens with ('\0' if none)
std::optional<char> pathStart(const std::string& token) {
    std::size_t begin = 0;
    char quote = '\0';
    while (begin < token.size() && isWrap(token[begin])) {
        if (token[begin] == '\'' || token[begin] == '"') {
            quote = token[begin];
        }
        ++begin;
    }
    std::string core = token.substr(begin);
    auto eq = core.find('=');
    if (eq != std::string::npos && looksLikePath(core.substr(eq + 1))) {
        return quote;
    }
    while (!core.empty() && isWrap(core.back())) {
        core.pop_back();
    }
    if (looksLikePath(core)) {
        return quote;
    }
    return std::nullopt;
}

// A path is complete once its last component has an extension or it runs
// into a delimiter; a quoted path runs to its closing quote.
bool pathComplete(const std::string& span, char quote) {
    if (quote != '\0') {
        return span.find(quote, span.find(quote) + 1) != std::string::npos;
    }
    if (!span.empty() && isWrap(span.back())) {
        return true;
    }
    auto slash = span.rfind('/');
    auto dot = span.rfind('.');
    return dot != std::string::npos && (slash == std::string::npos || dot > slash + 1);
}

// Surrounding quotes/punctuation are kept so "'/a/b.mp4':" becomes "'<path>':"
std::string redactSpan(const std::string& span) {
    std::size_t begin = 0;
    std::size_t end = span.size();
    while (begin < end && isWrap(span[begin])) ++begin;
    while (end > begin && isWrap(span[end - 1])) --end;

    std::string core = span.substr(begin, end - begin);
    auto eq = core.find('=');
    if (eq != std::string::npos && looksLikePath(core.substr(eq + 1))) {
        return span.substr(0, begin) + core.substr(0, eq + 1) + "<path>" + span.substr(end);
    }
    if (looksLikePath(core)) {
        return span.substr(0, begin) + "<path>" + span.substr(end);
    }
    return span;
}

}

const char* toString(Status status) noexcept {
    switch (status) {
        case Status::Queued: return "queued";
        case Status::Stage1Running: return "extracting_audio";
        case Status::Stage2Running: return "transcribing";
        case Status::Completed: return "completed";
        case Status::Failed: return "failed";
    }
    return "unknown";
}

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::Transcode: return "TranscodeError";
        case ErrorKind::Transcription: return "TranscriptionError";
        case ErrorKind::Internal: return "InternalError";
    }
    return "InternalError";
}

std::optional<Status> parseStatus(const std::string& value) noexcept {
    if (value == "queued") return Status::Queued;
    if (value == "extracting_audio") return Status::Stage1Running;
    if (value == "transcribing") return Status::Stage2Running;
    if (value == "completed") return Status::Completed;
    if (value == "failed") return Status::Failed;
    return std::nullopt;
}

bool isTerminal(Status status) noexcept {
    return status == Status::Completed || status == Status::Failed;
}

bool isRunning(Status status) noexcept {
    return status == Status::Stage1Running || status == Status::Stage2Running;
}

std::string redact(const std::string& message, std::size_t maxLength) {
    // Whitespace and newlines collapse to single spaces
    auto tokens = tokenize(message);
    std::string out;
    out.reserve(message.size());

    std::size_t i = 0;
    while (i < tokens.size()) {
        std::string span = tokens[i].text;
        std::size_t next = i + 1;
        if (auto quote = pathStart(span)) {
            // A path may contain spaces, but never crosses a line
            while (!pathComplete(span, *quote) && next < tokens.size() && !tokens[next].newlineBefore) {
                span += " " + tokens[next].text;
                ++next;
            }
            span = redactSpan(span);
        }
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += span;
        i = next;
    }

    while (!out.empty() && out.back() == ' ') {
        out.pop_back();
    }
    if (out.size() > maxLength) {
        out.resize(maxLength > 3 ? maxLength - 3 : maxLength);
        out += "...";
    }
    return out;
}

} // namespace mediascribe
