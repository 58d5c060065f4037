// ZKANCHOR - Core Types Header
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// This file defines fundamental types used throughout ZKANCHOR.

#ifndef ZKANCHOR_CORE_TYPES_H
#define ZKANCHOR_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <vector>

namespace zkanchor {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Owned byte buffer
using ByteVector = std::vector<Byte>;

// ============================================================================
// Little-Endian Helpers
// ============================================================================

/// Append a 32-bit value in little-endian order
inline void WriteLE32(ByteVector& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<Byte>((value >> (i * 8)) & 0xFF));
    }
}

/// Append a 64-bit value in little-endian order
inline void WriteLE64(ByteVector& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<Byte>((value >> (i * 8)) & 0xFF));
    }
}

/// Read a 32-bit little-endian value (caller checks bounds)
inline uint32_t ReadLE32(const Byte* data) {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(data[i]) << (i * 8);
    }
    return value;
}

/// Read a 64-bit little-endian value (caller checks bounds)
inline uint64_t ReadLE64(const Byte* data) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data[i]) << (i * 8);
    }
    return value;
}

} // namespace zkanchor

#endif // ZKANCHOR_CORE_TYPES_H
