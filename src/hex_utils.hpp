#pragma once

#include <algorithm>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "error.hpp"

namespace txproof {

class HexUtils {
public:
    // Convert a hexadecimal string to a byte vector
    static std::vector<uint8_t> decode(const std::string& hex) {
        if (hex.length() % 2 != 0) {
            throw ProofError(ErrorKind::InvalidArgument, "Invalid hex string length");
        }

        std::vector<uint8_t> bytes;
        bytes.reserve(hex.length() / 2);

        for (size_t i = 0; i < hex.length(); i += 2) {
            int hi = nibble(hex[i]);
            int lo = nibble(hex[i + 1]);
            if (hi < 0 || lo < 0) {
                throw ProofError(ErrorKind::InvalidArgument, "Invalid hex character at offset " + std::to_string(i));
            }
            bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
        }

        return bytes;
    }

    // Convert a byte sequence to a lowercase hexadecimal string
    static std::string encode(std::span<const uint8_t> data) {
        std::string result;
        result.reserve(data.size() * 2);

        static const char hex_chars[] = "0123456789abcdef";
        for (uint8_t byte : data) {
            result.push_back(hex_chars[byte >> 4]);
            result.push_back(hex_chars[byte & 0x0F]);
        }

        return result;
    }

    // Hex-encode bytes in reverse order (internal <-> display order)
    static std::string encode_reversed(std::span<const uint8_t> data) {
        std::vector<uint8_t> reversed(data.rbegin(), data.rend());
        return encode(reversed);
    }

    // Lowercases hex so ids compare equal regardless of how callers typed them
    static std::string normalize(std::string hex) {
        std::transform(hex.begin(), hex.end(), hex.begin(),
            [](char c) { return (c >= 'A' && c <= 'F') ? static_cast<char>(c - 'A' + 'a') : c; });
        return hex;
    }

    // True for a 64-character hex identifier (txid or block hash)
    static bool is_hash_hex(const std::string& hex) {
        return hex.size() == 64 && std::all_of(hex.begin(), hex.end(),
            [](char c) { return nibble(c) >= 0; });
    }

private:
    static int nibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
};

} // namespace txproof
