#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Standard Base64 (RFC 4648) with '=' padding. Used to keep compressed
// scrollback JSON-safe.
namespace base64 {

inline std::string encode(std::string_view data) {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < data.size()) {
        uint32_t n = (uint32_t(uint8_t(data[i])) << 16) |
                     (uint32_t(uint8_t(data[i + 1])) << 8) |
                      uint32_t(uint8_t(data[i + 2]));
        result.push_back(table[(n >> 18) & 0x3F]);
        result.push_back(table[(n >> 12) & 0x3F]);
        result.push_back(table[(n >> 6) & 0x3F]);
        result.push_back(table[n & 0x3F]);
        i += 3;
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t n = uint32_t(uint8_t(data[i])) << 16;
        result.push_back(table[(n >> 18) & 0x3F]);
        result.push_back(table[(n >> 12) & 0x3F]);
        result += "==";
    } else if (rest == 2) {
        uint32_t n = (uint32_t(uint8_t(data[i])) << 16) |
                     (uint32_t(uint8_t(data[i + 1])) << 8);
        result.push_back(table[(n >> 18) & 0x3F]);
        result.push_back(table[(n >> 12) & 0x3F]);
        result.push_back(table[(n >> 6) & 0x3F]);
        result.push_back('=');
    }
    return result;
}

// Returns nullopt on any character outside the alphabet or bad padding
inline std::optional<std::string> decode(std::string_view text) {
    auto value = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };

    if (text.size() % 4 != 0) return std::nullopt;

    std::string out;
    out.reserve(text.size() / 4 * 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        bool last = (i + 4 == text.size());
        int a = value(text[i]);
        int b = value(text[i + 1]);
        if (a < 0 || b < 0) return std::nullopt;

        char c3 = text[i + 2], c4 = text[i + 3];
        if (c3 == '=' || c4 == '=') {
            if (!last) return std::nullopt;
            if (c3 == '=' && c4 != '=') return std::nullopt;
        }

        uint32_t n = (uint32_t(a) << 18) | (uint32_t(b) << 12);
        out.push_back(char((n >> 16) & 0xFF));

        if (c3 != '=') {
            int c = value(c3);
            if (c < 0) return std::nullopt;
            n |= uint32_t(c) << 6;
            out.push_back(char((n >> 8) & 0xFF));
        }
        if (c4 != '=') {
            int d = value(c4);
            if (d < 0) return std::nullopt;
            n |= uint32_t(d);
            out.push_back(char(n & 0xFF));
        }
    }
    return out;
}

} // namespace base64
