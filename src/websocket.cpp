/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mediascribe/websocket.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace mediascribe::ws {

namespace {
constexpr const char* kGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

bool containsToken(const std::string& headerValue, const std::string& token) {
    std::stringstream ss(lower(headerValue));
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (trim(item) == token) {
            return true;
        }
    }
    return false;
}

bool isControl(Opcode opcode) noexcept {
    return (static_cast<std::uint8_t>(opcode) & 0x8) != 0;
}
}

std::optional<UpgradeRequest> parseUpgradeRequest(const std::string& head) {
    std::stringstream ss(head);
    std::string line;
    if (!std::getline(ss, line)) {
        return std::nullopt;
    }

    std::stringstream requestLine(trim(line));
    std::string method, target, version;
    requestLine >> method >> target >> version;
    if (method != "GET" || target.empty() || version.rfind("HTTP/1.1", 0) != 0) {
        return std::nullopt;
    }

    bool upgrade = false;
    bool connection = false;
    bool version13 = false;
    UpgradeRequest request;
    request.path = target.substr(0, target.find('?'));

    while (std::getline(ss, line)) {
        line = trim(line);
        if (line.empty()) {
            break;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string name = lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));
        if (name == "upgrade") {
            upgrade = containsToken(value, "websocket");
        } else if (name == "connection") {
            connection = containsToken(value, "upgrade");
        } else if (name == "sec-websocket-version") {
            version13 = value == "13";
        } else if (name == "sec-websocket-key") {
            request.key = value;
        }
    }

    if (!upgrade || !connection || !version13 || request.key.empty()) {
        return std::nullopt;
    }
    return request;
}

std::string acceptKey(const std::string& clientKey) {
    std::string input = clientKey + kGuid;
    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest);

    unsigned char encoded[4 * ((SHA_DIGEST_LENGTH + 2) / 3) + 1];
    int n = EVP_EncodeBlock(encoded, digest, SHA_DIGEST_LENGTH);
    return std::string(reinterpret_cast<const char*>(encoded), static_cast<std::size_t>(n));
}

std::string handshakeResponse(const std::string& clientKey) {
    return "HTTP/1.1 101 Switching Protocols\r\n"
           "Upgrade: websocket\r\n"
           "Connection: Upgrade\r\n"
           "Sec-WebSocket-Accept: " + acceptKey(clientKey) + "\r\n\r\n";
}

std::string rejectResponse(int status, const std::string& reason) {
    return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n"
           "Connection: close\r\n"
           "Content-Length: 0\r\n\r\n";
}

std::string encodeFrame(Opcode opcode, const std::string& payload) {
    std::string frame;
    frame.reserve(payload.size() + 10);
    frame.push_back(static_cast<char>(0x80 | static_cast<std::uint8_t>(opcode)));

    const std::uint64_t size = payload.size();
    if (size < 126) {
        frame.push_back(static_cast<char>(size));
    } else if (size <= 0xFFFF) {
        frame.push_back(static_cast<char>(126));
        frame.push_back(static_cast<char>((size >> 8) & 0xFF));
        frame.push_back(static_cast<char>(size & 0xFF));
    } else {
        frame.push_back(static_cast<char>(127));
        for (int shift = 56; shift >= 0; shift -= 8) {
            frame.push_back(static_cast<char>((size >> shift) & 0xFF));
        }
    }
    frame += payload;
    return frame;
}

std::optional<Frame> FrameReader::parseOne() {
    if (buffer_.size() < 2) {
        return std::nullopt;
    }
    const auto* bytes = reinterpret_cast<const unsigned char*>(buffer_.data());

    if (bytes[0] & 0x70) {
        throw std::runtime_error("reserved bits set in websocket frame");
    }
    Frame frame;
    frame.fin = (bytes[0] & 0x80) != 0;
    frame.opcode = static_cast<Opcode>(bytes[0] & 0x0F);
    const bool masked = (bytes[1] & 0x80) != 0;
    if (requireMask_ && !masked) {
        throw std::runtime_error("unmasked client frame");
    }

    std::size_t offset = 2;
    std::uint64_t length = bytes[1] & 0x7F;
    if (length == 126) {
        if (buffer_.size() < offset + 2) {
            return std::nullopt;
        }
        length = (static_cast<std::uint64_t>(bytes[2]) << 8) | bytes[3];
        offset += 2;
    } else if (length == 127) {
        if (buffer_.size() < offset + 8) {
            return std::nullopt;
        }
        length = 0;
        for (int i = 0; i < 8; ++i) {
            length = (length << 8) | bytes[2 + i];
        }
        offset += 8;
    }
    if (length > maxPayload_) {
        throw std::runtime_error("websocket frame too large");
    }
    if (isControl(frame.opcode) && (length > 125 || !frame.fin)) {
        throw std::runtime_error("invalid websocket control frame");
    }

    unsigned char mask[4] = {0, 0, 0, 0};
    if (masked) {
        if (buffer_.size() < offset + 4) {
            return std::nullopt;
        }
        std::copy(bytes + offset, bytes + offset + 4, mask);
        offset += 4;
    }
    if (buffer_.size() < offset + length) {
        return std::nullopt;
    }

    frame.payload = buffer_.substr(offset, static_cast<std::size_t>(length));
    if (masked) {
        for (std::size_t i = 0; i < frame.payload.size(); ++i) {
            frame.payload[i] = static_cast<char>(frame.payload[i] ^ mask[i % 4]);
        }
    }
    buffer_.erase(0, offset + static_cast<std::size_t>(length));
    return frame;
}

std::optional<Frame> FrameReader::next() {
    while (auto frame = parseOne()) {
        if (isControl(frame->opcode)) {
            return frame;
        }
        if (frame->opcode == Opcode::Continuation) {
            if (!partial_) {
                throw std::runtime_error("continuation without a message");
            }
            partial_->payload += frame->payload;
            if (partial_->payload.size() > maxPayload_) {
                throw std::runtime_error("websocket message too large");
            }
            if (frame->fin) {
                Frame done = std::move(*partial_);
                done.fin = true;
                partial_.reset();
                return done;
            }
            continue;
        }
        if (partial_) {
            throw std::runtime_error("new message before the previous one ended");
        }
        if (frame->fin) {
            return frame;
        }
        partial_ = std::move(frame);
    }
    return std::nullopt;
}

}
