// ZKANCHOR - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#ifndef ZKANCHOR_CORE_HEX_H
#define ZKANCHOR_CORE_HEX_H

#include <cstddef>
#include <string>
#include <vector>
#include <array>

#include "zkanchor/core/types.h"

namespace zkanchor {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const Byte* data, size_t len);
std::string BytesToHex(const ByteVector& data);

template<size_t N>
std::string BytesToHex(const std::array<Byte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes (throws std::invalid_argument)
ByteVector HexToBytes(const std::string& hex);

/// Check if string is valid, even-length hex
bool IsValidHex(const std::string& str);

/// Value of a single hex digit, or -1
int HexCharToNibble(char c);

/// Strip an optional 0x / 0X prefix
std::string StripHexPrefix(const std::string& hex);

} // namespace zkanchor

#endif // ZKANCHOR_CORE_HEX_H
