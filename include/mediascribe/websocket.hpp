/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace mediascribe::ws {

enum class Opcode : std::uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA,
};

struct UpgradeRequest {
    std::string path;
    std::string key;
};

// Parses the client's opening handshake (everything up to the blank line).
// Returns nullopt unless it is a GET carrying Upgrade: websocket, version 13
// and a key.
[[nodiscard]] std::optional<UpgradeRequest> parseUpgradeRequest(const std::string& head);

// Sec-WebSocket-Accept value for a client key.
[[nodiscard]] std::string acceptKey(const std::string& clientKey);

[[nodiscard]] std::string handshakeResponse(const std::string& clientKey);
[[nodiscard]] std::string rejectResponse(int status, const std::string& reason);

// Server-to-client frame: FIN set, never masked.
[[nodiscard]] std::string encodeFrame(Opcode opcode, const std::string& payload);

struct Frame {
    Opcode opcode = Opcode::Text;
    bool fin = true;
    std::string payload;
};

// Incremental frame parser. Fragmented text/binary messages are reassembled;
// control frames come out as they arrive.
class FrameReader {
public:
    explicit FrameReader(bool requireMask = true, std::size_t maxPayload = 64 * 1024) noexcept
        : requireMask_(requireMask), maxPayload_(maxPayload) {}

    void feed(const char* data, std::size_t size) { buffer_.append(data, size); }

    // Next complete message, or nullopt when more bytes are needed.
    // Throws std::runtime_error on a protocol violation.
    std::optional<Frame> next();

private:
    std::optional<Frame> parseOne();

    bool requireMask_;
    std::size_t maxPayload_;
    std::string buffer_;
    std::optional<Frame> partial_;
};

}
