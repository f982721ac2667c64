#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

// Primitive RFC 6455 lato client: URL, handshake, framing.

struct WsUrl {
    std::string host;
    std::string port;   // default "80"
    std::string path;   // default "/"
};

// Solo "ws://host[:port][/path]"
std::optional<WsUrl> ParseWsUrl(const std::string& url);

namespace WsOpcode {
    constexpr std::uint8_t Continuation = 0x0;
    constexpr std::uint8_t Text = 0x1;
    constexpr std::uint8_t Binary = 0x2;
    constexpr std::uint8_t Close = 0x8;
    constexpr std::uint8_t Ping = 0x9;
    constexpr std::uint8_t Pong = 0xA;
}

constexpr std::uint64_t kWsMaxPayload = 4ull * 1024 * 1024;

std::string Base64Encode(const std::uint8_t* data, std::size_t len);
std::array<std::uint8_t, 20> Sha1Digest(const std::uint8_t* data, std::size_t len);

// base64(sha1(key + GUID))
std::string ComputeAcceptKey(const std::string& clientKey);

std::string BuildHandshakeRequest(const WsUrl& url, const std::string& clientKey);

// headers = risposta HTTP completa fino a "\r\n\r\n"
bool ValidateHandshakeResponse(const std::string& headers, const std::string& clientKey, std::string& outErr);

// Frame client (FIN=1, sempre mascherato)
std::string EncodeClientFrame(std::uint8_t opcode, const std::string& payload, const std::array<std::uint8_t, 4>& mask);

struct WsFrameHeader {
    bool fin = false;
    std::uint8_t opcode = 0;
    bool masked = false;
    std::uint64_t payloadLen = 0;
    std::size_t headerLen = 0;          // byte di header inclusa la maschera
    std::array<std::uint8_t, 4> mask{};
};

// nullopt se i byte disponibili non bastano per l'header
std::optional<WsFrameHeader> DecodeFrameHeader(const std::uint8_t* data, std::size_t len);
