// ZKANCHOR - Proof Container Implementation
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include "zkanchor/backend/proof.h"

#include "zkanchor/core/errors.h"
#include "zkanchor/core/hex.h"

#include <cstring>
#include <optional>

namespace zkanchor {
namespace backend {

namespace {

constexpr size_t HEADER_SIZE = 4 + 1 + 1;

} // namespace

// ============================================================================
// Proof System Names
// ============================================================================

const char* ProofSystemToString(ProofSystem system) {
    switch (system) {
        case ProofSystem::Transparent: return "transparent";
        case ProofSystem::Groth16: return "groth16";
        case ProofSystem::PLONK: return "plonk";
        default: return "unknown";
    }
}

bool IsKnownProofSystem(uint8_t id) {
    return id >= static_cast<uint8_t>(ProofSystem::Transparent) &&
           id <= static_cast<uint8_t>(ProofSystem::PLONK);
}

// ============================================================================
// Proof
// ============================================================================

Proof::Proof(ProofSystem system, const protocol::ParamsStamp& stamp,
             const protocol::PublicInputs& publicInputs, ByteVector blob)
    : system_(system)
    , stamp_(stamp)
    , public_(publicInputs)
    , blob_(std::move(blob)) {
    if (publicInputs.Field().Modulus() != stamp.modulus) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "public inputs do not belong to the stamped field");
    }
    if (blob_.size() > MAX_BLOB_SIZE) {
        throw ProofFormatError("blob of " + std::to_string(blob_.size()) +
                               " bytes exceeds the maximum");
    }
}

ByteVector Proof::ToBytes() const {
    ByteVector result;
    ByteVector stamp = stamp_.Encode();
    ByteVector inputs = public_.ToBytes();
    result.reserve(HEADER_SIZE + stamp.size() + inputs.size() + 4 + blob_.size());

    result.insert(result.end(), MAGIC, MAGIC + sizeof(MAGIC));
    result.push_back(VERSION);
    result.push_back(static_cast<Byte>(system_));
    result.insert(result.end(), stamp.begin(), stamp.end());
    result.insert(result.end(), inputs.begin(), inputs.end());
    WriteLE32(result, static_cast<uint32_t>(blob_.size()));
    result.insert(result.end(), blob_.begin(), blob_.end());

    return result;
}

Proof Proof::FromBytes(const PrimeField& field, const Byte* data, size_t len) {
    if (len < HEADER_SIZE + protocol::ParamsStamp::SIZE) {
        throw ProofFormatError("truncated header (" + std::to_string(len) + " bytes)");
    }
    if (std::memcmp(data, MAGIC, sizeof(MAGIC)) != 0) {
        throw ProofFormatError("bad magic");
    }
    if (data[4] != VERSION) {
        throw ProofFormatError("unsupported version " + std::to_string(data[4]));
    }
    if (!IsKnownProofSystem(data[5])) {
        throw ProofFormatError("unknown proof system " + std::to_string(data[5]));
    }
    ProofSystem system = static_cast<ProofSystem>(data[5]);

    size_t offset = HEADER_SIZE;
    protocol::ParamsStamp stamp =
        protocol::ParamsStamp::Decode(data + offset, protocol::ParamsStamp::SIZE);
    offset += protocol::ParamsStamp::SIZE;

    if (stamp.modulus != field.Modulus()) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "proof is stamped with modulus 0x" + stamp.modulus.ToHex() +
                          ", expected the " + field.Name() + " field");
    }

    const size_t inputsSize = protocol::PublicInputs::COUNT * field.ByteWidth();
    if (len - offset < inputsSize + 4) {
        throw ProofFormatError("truncated public inputs");
    }

    std::optional<protocol::PublicInputs> inputs;
    try {
        inputs = protocol::PublicInputs::FromBytes(field, data + offset, inputsSize);
    } catch (const FieldError& e) {
        throw ProofFormatError("public inputs: " + std::string(e.what()));
    }
    offset += inputsSize;

    uint32_t blobLen = ReadLE32(data + offset);
    offset += 4;
    if (blobLen > MAX_BLOB_SIZE) {
        throw ProofFormatError("blob length " + std::to_string(blobLen) +
                               " exceeds the maximum");
    }
    if (len - offset != blobLen) {
        throw ProofFormatError("blob length " + std::to_string(blobLen) + " but " +
                               std::to_string(len - offset) + " bytes remain");
    }

    return Proof(system, stamp, *inputs, ByteVector(data + offset, data + len));
}

std::string Proof::ToHex() const {
    return BytesToHex(ToBytes());
}

Proof Proof::FromHex(const PrimeField& field, const std::string& hex) {
    ByteVector bytes;
    try {
        bytes = HexToBytes(hex);
    } catch (const std::invalid_argument& e) {
        throw ProofFormatError("invalid hex: " + std::string(e.what()));
    }
    return FromBytes(field, bytes);
}

} // namespace backend
} // namespace zkanchor
