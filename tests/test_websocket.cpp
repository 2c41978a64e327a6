/*
 * mediascribe - Media Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <cassert>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <string>

#include "mediascribe/websocket.hpp"

using namespace mediascribe;

namespace {

template <typename Fn>
bool throwsRuntime(Fn fn) {
    try {
        fn();
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

std::string bytes(std::initializer_list<int> values) {
    std::string out;
    for (int v : values) {
        out.push_back(static_cast<char>(v));
    }
    return out;
}

}

int main() {
    std::cout << "[Test] Opening handshake..." << std::endl;
    {
        assert(ws::acceptKey("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");

        std::string head =
            "GET /ws?client=ui HTTP/1.1\r\n"
            "Host: localhost:8001\r\n"
            "upgrade: WebSocket\r\n"
            "Connection: keep-alive, Upgrade\r\n"
            "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
            "Sec-WebSocket-Version: 13\r\n\r\n";
        auto request = ws::parseUpgradeRequest(head);
        assert(request);
        assert(request->path == "/ws");
        assert(request->key == "dGhlIHNhbXBsZSBub25jZQ==");

        auto response = ws::handshakeResponse(request->key);
        assert(response.rfind("HTTP/1.1 101 ", 0) == 0);
        assert(response.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n") != std::string::npos);

        assert(!ws::parseUpgradeRequest("GET /ws HTTP/1.1\r\nHost: x\r\n\r\n"));
        assert(!ws::parseUpgradeRequest("POST /ws HTTP/1.1\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n"
                                        "Sec-WebSocket-Key: abc\r\nSec-WebSocket-Version: 13\r\n\r\n"));
        assert(!ws::parseUpgradeRequest("GET /ws HTTP/1.1\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n"
                                        "Sec-WebSocket-Key: abc\r\nSec-WebSocket-Version: 8\r\n\r\n"));
        assert(ws::rejectResponse(404, "Not Found").rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);
    }

    std::cout << "[Test] Server frames..." << std::endl;
    {
        assert(ws::encodeFrame(ws::Opcode::Text, "Hello") == bytes({0x81, 0x05}) + "Hello");

        std::string medium(300, 'a');
        auto frame = ws::encodeFrame(ws::Opcode::Text, medium);
        assert(frame.size() == 4 + 300);
        assert(frame.substr(0, 4) == bytes({0x81, 126, 0x01, 0x2C}));

        std::string large(70000, 'b');
        frame = ws::encodeFrame(ws::Opcode::Binary, large);
        assert(frame.size() == 10 + 70000);
        assert(frame.substr(0, 10) == bytes({0x82, 127, 0, 0, 0, 0, 0, 0x01, 0x11, 0x70}));
    }

    std::cout << "[Test] Masked client frames, split across reads..." << std::endl;
    {
        // Masked "Hello" from RFC 6455 section 5.7
        std::string hello = bytes({0x81, 0x85, 0x37, 0xfa, 0x21, 0x3d, 0x7f, 0x9f, 0x4d, 0x51, 0x58});
        ws::FrameReader reader;
        reader.feed(hello.data(), 3);
        assert(!reader.next());
        reader.feed(hello.data() + 3, hello.size() - 3);
        auto frame = reader.next();
        assert(frame);
        assert(frame->opcode == ws::Opcode::Text);
        assert(frame->payload == "Hello");
        assert(!reader.next());
    }

    std::cout << "[Test] Fragments are joined, control frames pass through..." << std::endl;
    {
        ws::FrameReader reader(false);
        std::string data = bytes({0x01, 0x03}) + "Hel" +  // text, not final
                           bytes({0x89, 0x02}) + "hi" +   // ping in between
                           bytes({0x80, 0x02}) + "lo";    // final continuation
        reader.feed(data.data(), data.size());

        auto ping = reader.next();
        assert(ping && ping->opcode == ws::Opcode::Ping && ping->payload == "hi");
        auto text = reader.next();
        assert(text && text->opcode == ws::Opcode::Text && text->payload == "Hello");
        assert(!reader.next());
    }

    std::cout << "[Test] Protocol violations are rejected..." << std::endl;
    {
        ws::FrameReader strict;
        std::string unmasked = ws::encodeFrame(ws::Opcode::Text, "x");
        strict.feed(unmasked.data(), unmasked.size());
        assert(throwsRuntime([&] { (void)strict.next(); }));

        ws::FrameReader small(false, 16);
        std::string big = ws::encodeFrame(ws::Opcode::Text, std::string(17, 'z'));
        small.feed(big.data(), big.size());
        assert(throwsRuntime([&] { (void)small.next(); }));

        ws::FrameReader orphan(false);
        std::string cont = bytes({0x80, 0x01}) + "q";
        orphan.feed(cont.data(), cont.size());
        assert(throwsRuntime([&] { (void)orphan.next(); }));
    }

    std::cout << "[Test] WebSocket tests passed." << std::endl;
    return 0;
}
