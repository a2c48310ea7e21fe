/**
 * @file Digest.hpp
 * @brief Fixed-size SHA-256 digest and opaque signature value types.
 */

#pragma once
#include <algorithm>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace medoracle::domain {

/** @brief 256-bit digest of a canonical serialization. */
using Digest = std::array<std::uint8_t, 32>;

/** @brief Opaque signature bytes produced by a SigningPrimitive. */
using Signature = std::vector<std::uint8_t>;

inline std::string ToHex(const std::uint8_t* data, std::size_t size) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

inline std::string ToHex(const Digest& digest) {
    return ToHex(digest.data(), digest.size());
}

inline std::string ToHex(const Signature& signature) {
    return ToHex(signature.data(), signature.size());
}

inline std::vector<std::uint8_t> BytesFromHex(const std::string& hex) {
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("Hex string has odd length.");
    }
    std::vector<std::uint8_t> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex character in: " + hex);
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

inline Digest DigestFromHex(const std::string& hex) {
    auto bytes = BytesFromHex(hex);
    if (bytes.size() != Digest{}.size()) {
        throw std::invalid_argument("Digest must be 32 bytes, got " + std::to_string(bytes.size()));
    }
    Digest digest{};
    std::copy(bytes.begin(), bytes.end(), digest.begin());
    return digest;
}

} // namespace medoracle::domain
