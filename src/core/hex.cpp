// ZKANCHOR - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include "zkanchor/core/hex.h"

#include <stdexcept>

namespace zkanchor {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";
}

int HexCharToNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string StripHexPrefix(const std::string& hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        return hex.substr(2);
    }
    return hex;
}

std::string BytesToHex(const Byte* data, size_t len) {
    std::string result;
    result.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        result.push_back(HEX_CHARS[data[i] >> 4]);
        result.push_back(HEX_CHARS[data[i] & 0x0F]);
    }

    return result;
}

std::string BytesToHex(const ByteVector& data) {
    return BytesToHex(data.data(), data.size());
}

ByteVector HexToBytes(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.length() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    ByteVector result;
    result.reserve(digits.length() / 2);

    for (size_t i = 0; i < digits.length(); i += 2) {
        int high = HexCharToNibble(digits[i]);
        int low = HexCharToNibble(digits[i + 1]);

        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character");
        }

        result.push_back(static_cast<Byte>((high << 4) | low));
    }

    return result;
}

bool IsValidHex(const std::string& str) {
    std::string digits = StripHexPrefix(str);
    if (digits.empty() || digits.length() % 2 != 0) {
        return false;
    }

    for (char c : digits) {
        if (HexCharToNibble(c) < 0) {
            return false;
        }
    }

    return true;
}

} // namespace zkanchor
