#include "Core/Transport/WsFrame.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>
#include "Core/StringUtils.hpp"

// ---------------------------------------------------------------------------
// SHA-1 minimale (serve solo per Sec-WebSocket-Accept)
// ---------------------------------------------------------------------------
namespace {

class Sha1 {
public:
    void update(const std::uint8_t* data, std::size_t len) {
        m_bits += static_cast<std::uint64_t>(len) * 8u;
        while (len > 0) {
            const std::size_t n = std::min<std::size_t>(64 - m_used, len);
            std::memcpy(m_block.data() + m_used, data, n);
            m_used += n; data += n; len -= n;
            if (m_used == 64) { process(m_block.data()); m_used = 0; }
        }
    }

    std::array<std::uint8_t, 20> finish() {
        m_block[m_used++] = 0x80;
        if (m_used > 56) {
            while (m_used < 64) m_block[m_used++] = 0;
            process(m_block.data());
            m_used = 0;
        }
        while (m_used < 56) m_block[m_used++] = 0;
        for (int i = 7; i >= 0; --i) m_block[m_used++] = static_cast<std::uint8_t>(m_bits >> (i * 8));
        process(m_block.data());

        std::array<std::uint8_t, 20> out{};
        for (int i = 0; i < 5; ++i) {
            out[i * 4 + 0] = static_cast<std::uint8_t>(m_h[i] >> 24);
            out[i * 4 + 1] = static_cast<std::uint8_t>(m_h[i] >> 16);
            out[i * 4 + 2] = static_cast<std::uint8_t>(m_h[i] >> 8);
            out[i * 4 + 3] = static_cast<std::uint8_t>(m_h[i]);
        }
        return out;
    }

private:
    static std::uint32_t rol(std::uint32_t v, int b) { return (v << b) | (v >> (32 - b)); }

    void process(const std::uint8_t* p) {
        std::uint32_t w[80];
        for (int i = 0; i < 16; ++i)
            w[i] = (std::uint32_t(p[i * 4]) << 24) | (std::uint32_t(p[i * 4 + 1]) << 16)
                 | (std::uint32_t(p[i * 4 + 2]) << 8) | std::uint32_t(p[i * 4 + 3]);
        for (int i = 16; i < 80; ++i) w[i] = rol(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);

        std::uint32_t a = m_h[0], b = m_h[1], c = m_h[2], d = m_h[3], e = m_h[4];
        for (int i = 0; i < 80; ++i) {
            std::uint32_t f, k;
            if (i < 20)      { f = (b & c) | (~b & d);           k = 0x5A827999; }
            else if (i < 40) { f = b ^ c ^ d;                    k = 0x6ED9EBA1; }
            else if (i < 60) { f = (b & c) | (b & d) | (c & d);  k = 0x8F1BBCDC; }
            else             { f = b ^ c ^ d;                    k = 0xCA62C1D6; }
            const std::uint32_t t = rol(a, 5) + f + e + k + w[i];
            e = d; d = c; c = rol(b, 30); b = a; a = t;
        }
        m_h[0] += a; m_h[1] += b; m_h[2] += c; m_h[3] += d; m_h[4] += e;
    }

    std::array<std::uint8_t, 64> m_block{};
    std::size_t m_used{ 0 };
    std::uint64_t m_bits{ 0 };
    std::array<std::uint32_t, 5> m_h{ { 0x67452301u, 0xEFCDAB89u, 0x98BADCFEu, 0x10325476u, 0xC3D2E1F0u } };
};

} // namespace

std::array<std::uint8_t, 20> Sha1Digest(const std::uint8_t* data, std::size_t len) {
    Sha1 sha;
    sha.update(data, len);
    return sha.finish();
}

std::string Base64Encode(const std::uint8_t* data, std::size_t len) {
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve(((len + 2) / 3) * 4);
    for (std::size_t i = 0; i < len; i += 3) {
        const std::size_t n = std::min<std::size_t>(3, len - i);
        std::uint32_t triple = std::uint32_t(data[i]) << 16;
        if (n > 1) triple |= std::uint32_t(data[i + 1]) << 8;
        if (n > 2) triple |= std::uint32_t(data[i + 2]);
        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out.push_back(n > 1 ? kAlphabet[(triple >> 6) & 0x3F] : '=');
        out.push_back(n > 2 ? kAlphabet[triple & 0x3F] : '=');
    }
    return out;
}

std::string ComputeAcceptKey(const std::string& clientKey) {
    static constexpr char kGuid[] = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    const std::string merged = clientKey + kGuid;
    const auto digest = Sha1Digest(reinterpret_cast<const std::uint8_t*>(merged.data()), merged.size());
    return Base64Encode(digest.data(), digest.size());
}

// ---------------------------------------------------------------------------
// URL + handshake
// ---------------------------------------------------------------------------
std::optional<WsUrl> ParseWsUrl(const std::string& url) {
    static const std::string kPrefix = "ws://";
    if (toLower(url.substr(0, kPrefix.size())) != kPrefix) return std::nullopt;

    const std::string rest = url.substr(kPrefix.size());
    const auto slash = rest.find('/');
    const std::string authority = trim(slash == std::string::npos ? rest : rest.substr(0, slash));
    std::string path = slash == std::string::npos ? "/" : rest.substr(slash);

    const auto colon = authority.rfind(':');
    WsUrl out;
    if (colon == std::string::npos) {
        out.host = authority;
        out.port = "80";
    }
    else {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
        if (out.port.empty()) out.port = "80";
        if (!std::all_of(out.port.begin(), out.port.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
            return std::nullopt;
    }
    if (out.host.empty()) return std::nullopt;
    out.path = path.empty() ? "/" : path;
    return out;
}

std::string BuildHandshakeRequest(const WsUrl& url, const std::string& clientKey) {
    std::ostringstream req;
    req << "GET " << url.path << " HTTP/1.1\r\n"
        << "Host: " << url.host << ":" << url.port << "\r\n"
        << "Upgrade: websocket\r\n"
        << "Connection: Upgrade\r\n"
        << "Sec-WebSocket-Key: " << clientKey << "\r\n"
        << "Sec-WebSocket-Version: 13\r\n"
        << "\r\n";
    return req.str();
}

static std::string headerValue(const std::string& headers, const std::string& key) {
    std::istringstream in(headers);
    std::string line;
    while (std::getline(in, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (toLower(trim(line.substr(0, colon))) == key) return trim(line.substr(colon + 1));
    }
    return {};
}

bool ValidateHandshakeResponse(const std::string& headers, const std::string& clientKey, std::string& outErr) {
    if (headers.rfind("HTTP/1.1 101", 0) != 0 && headers.rfind("HTTP/1.0 101", 0) != 0) {
        outErr = "unexpected_status: " + headers.substr(0, headers.find('\r'));
        return false;
    }
    if (toLower(headerValue(headers, "upgrade")) != "websocket") {
        outErr = "missing_upgrade";
        return false;
    }
    if (headerValue(headers, "sec-websocket-accept") != ComputeAcceptKey(clientKey)) {
        outErr = "bad_accept_key";
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Framing
// ---------------------------------------------------------------------------
std::string EncodeClientFrame(std::uint8_t opcode, const std::string& payload, const std::array<std::uint8_t, 4>& mask) {
    std::string frame;
    const std::uint64_t len = payload.size();
    frame.reserve(14 + payload.size());
    frame.push_back(static_cast<char>(0x80 | (opcode & 0x0F)));

    if (len < 126) {
        frame.push_back(static_cast<char>(0x80 | len));
    }
    else if (len <= 0xFFFF) {
        frame.push_back(static_cast<char>(0x80 | 126));
        frame.push_back(static_cast<char>((len >> 8) & 0xFF));
        frame.push_back(static_cast<char>(len & 0xFF));
    }
    else {
        frame.push_back(static_cast<char>(0x80 | 127));
        for (int i = 7; i >= 0; --i) frame.push_back(static_cast<char>((len >> (i * 8)) & 0xFF));
    }
    for (auto b : mask) frame.push_back(static_cast<char>(b));
    for (std::size_t i = 0; i < payload.size(); ++i)
        frame.push_back(static_cast<char>(static_cast<std::uint8_t>(payload[i]) ^ mask[i % 4]));
    return frame;
}

std::optional<WsFrameHeader> DecodeFrameHeader(const std::uint8_t* data, std::size_t len) {
    if (len < 2) return std::nullopt;

    WsFrameHeader h;
    h.fin = (data[0] & 0x80u) != 0;
    h.opcode = data[0] & 0x0Fu;
    h.masked = (data[1] & 0x80u) != 0;
    h.payloadLen = data[1] & 0x7Fu;
    std::size_t pos = 2;

    if (h.payloadLen == 126) {
        if (len < pos + 2) return std::nullopt;
        h.payloadLen = (std::uint64_t(data[2]) << 8) | data[3];
        pos += 2;
    }
    else if (h.payloadLen == 127) {
        if (len < pos + 8) return std::nullopt;
        h.payloadLen = 0;
        for (int i = 0; i < 8; ++i) h.payloadLen = (h.payloadLen << 8) | data[pos + i];
        pos += 8;
    }

    if (h.masked) {
        if (len < pos + 4) return std::nullopt;
        std::copy(data + pos, data + pos + 4, h.mask.begin());
        pos += 4;
    }
    h.headerLen = pos;
    return h;
}
