#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <stdexcept>
#include <cstdint>

namespace farfalle {

inline std::vector<std::uint8_t> to_bytes(std::string_view s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

inline std::span<const std::uint8_t> as_bytes(std::string_view s) {
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

inline std::string hex_lower(std::span<const std::uint8_t> b) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(b.size() * 2);
    for (size_t i = 0; i < b.size(); ++i) {
        out[2*i]   = kHex[(b[i] >> 4) & 0xF];
        out[2*i+1] = kHex[b[i] & 0xF];
    }
    return out;
}

// Test-vector layout: "[0x4, 0x54, 0xa1, ]". Each byte is an unpadded
// lowercase hex literal followed by ", ".
inline std::string hex_list(std::span<const std::uint8_t> b) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out = "[";
    out.reserve(2 + b.size() * 6);
    for (const std::uint8_t v : b) {
        out += "0x";
        if (v >= 0x10) out += kHex[(v >> 4) & 0xF];
        out += kHex[v & 0xF];
        out += ", ";
    }
    out += "]";
    return out;
}

inline void require(bool cond, std::string_view msg) {
    if (!cond) throw std::invalid_argument(std::string(msg));
}

inline std::vector<std::uint8_t> from_hex(std::string_view s) {
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    require(s.size() % 2 == 0, "hex string must have even length");
    std::vector<std::uint8_t> out(s.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        const int hi = nibble(s[2*i]);
        const int lo = nibble(s[2*i+1]);
        require(hi >= 0 && lo >= 0, "invalid hex digit");
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return out;
}

} // namespace farfalle
