#include "infrastructure/Base64.hpp"

namespace dreadloom::infrastructure {

namespace {

int DecodeChar(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}

} // namespace

std::optional<std::vector<std::uint8_t>> Base64Decode(const std::string& encoded) {
    std::vector<std::uint8_t> out;
    out.reserve(encoded.size() / 4 * 3);

    std::uint32_t buffer = 0;
    int bits = -8;
    std::size_t symbols = 0;
    for (char c : encoded) {
        if (c == '=') break;
        if (c == '\n' || c == '\r' || c == ' ' || c == '\t') continue;

        int value = DecodeChar(c);
        if (value < 0) return std::nullopt;

        ++symbols;
        buffer = (buffer << 6) | static_cast<std::uint32_t>(value);
        bits += 6;
        if (bits >= 0) {
            out.push_back(static_cast<std::uint8_t>((buffer >> bits) & 0xFF));
            bits -= 8;
        }
    }

    // A single leftover symbol carries fewer than 8 bits.
    if (symbols % 4 == 1) return std::nullopt;
    return out;
}

std::string DetectImageMimeType(const std::vector<std::uint8_t>& bytes) {
    if (bytes.size() >= 8 && bytes[0] == 0x89 && bytes[1] == 0x50 && bytes[2] == 0x4E && bytes[3] == 0x47) {
        return "image/png";
    }
    if (bytes.size() >= 2 && bytes[0] == 0xFF && bytes[1] == 0xD8) {
        return "image/jpeg";
    }
    return "application/octet-stream";
}

} // namespace dreadloom::infrastructure
