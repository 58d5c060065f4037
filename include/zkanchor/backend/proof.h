// ZKANCHOR - Proof Container
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// An anchored range proof: backend blob plus the public tuple and the
// protocol parameters it was produced under. Wire format:
//
//   magic "ZKAP" | version (1) | system (1) | parameter stamp (72)
//   | public inputs (3 field elements) | blob length (LE32) | blob

#ifndef ZKANCHOR_BACKEND_PROOF_H
#define ZKANCHOR_BACKEND_PROOF_H

#include <cstdint>
#include <string>

#include "zkanchor/backend/backend.h"
#include "zkanchor/core/types.h"
#include "zkanchor/protocol/params.h"
#include "zkanchor/protocol/witness.h"

namespace zkanchor {
namespace backend {

class Proof {
public:
    static constexpr Byte MAGIC[4] = {'Z', 'K', 'A', 'P'};
    static constexpr Byte VERSION = 1;

    /// Upper bound on the blob length accepted when decoding
    static constexpr size_t MAX_BLOB_SIZE = 4 * 1024 * 1024;

    Proof(ProofSystem system, const protocol::ParamsStamp& stamp,
          const protocol::PublicInputs& publicInputs, ByteVector blob);

    ProofSystem System() const { return system_; }
    const protocol::ParamsStamp& Stamp() const { return stamp_; }
    const protocol::PublicInputs& Public() const { return public_; }
    const ByteVector& Blob() const { return blob_; }

    ByteVector ToBytes() const;

    /**
     * Strict decoding against the field the caller verifies over.
     *
     * Throws ProofFormatError on any malformed field or trailing bytes and
     * ConfigError::ParameterMismatch when the stamped modulus is not the
     * modulus of the expected field. The stamp is never used to look up
     * or register a field.
     */
    static Proof FromBytes(const PrimeField& field, const Byte* data, size_t len);
    static Proof FromBytes(const PrimeField& field, const ByteVector& data) {
        return FromBytes(field, data.data(), data.size());
    }

    std::string ToHex() const;
    static Proof FromHex(const PrimeField& field, const std::string& hex);

    bool operator==(const Proof& other) const {
        return system_ == other.system_ && stamp_ == other.stamp_ &&
               public_ == other.public_ && blob_ == other.blob_;
    }

private:
    ProofSystem system_;
    protocol::ParamsStamp stamp_;
    protocol::PublicInputs public_;
    ByteVector blob_;
};

} // namespace backend
} // namespace zkanchor

#endif // ZKANCHOR_BACKEND_PROOF_H
