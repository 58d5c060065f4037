// ZKANCHOR - SHA256 Hash Function
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// Incremental SHA-256 backed by the OpenSSL EVP interface. Used to derive
// Poseidon round constants deterministically.

#ifndef ZKANCHOR_CRYPTO_SHA256_H
#define ZKANCHOR_CRYPTO_SHA256_H

#include <array>
#include <cstddef>
#include <memory>
#include <string>

#include "zkanchor/core/types.h"

namespace zkanchor {

using Sha256Digest = std::array<Byte, 32>;

/// SHA-256 hasher with Write/Finalize/Reset chaining
class SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    SHA256& Write(const Byte* data, size_t len);
    SHA256& Write(const ByteVector& data) { return Write(data.data(), data.size()); }
    SHA256& Write(const std::string& data);

    /// Finalize into `hash` (OUTPUT_SIZE bytes). The hasher must be Reset
    /// before it is written again.
    void Finalize(Byte hash[OUTPUT_SIZE]);

    SHA256& Reset();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// One-shot SHA-256
Sha256Digest SHA256Hash(const Byte* data, size_t len);

inline Sha256Digest SHA256Hash(const ByteVector& data) {
    return SHA256Hash(data.data(), data.size());
}

} // namespace zkanchor

#endif // ZKANCHOR_CRYPTO_SHA256_H
