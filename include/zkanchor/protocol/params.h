// ZKANCHOR - Protocol Parameters
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// The parameters every component of one deployment must agree on: the
// scalar field, tree depth D, range bit-width B and the anchor domain tag.
// A compact stamp of them travels inside every proof.

#ifndef ZKANCHOR_PROTOCOL_PARAMS_H
#define ZKANCHOR_PROTOCOL_PARAMS_H

#include <cstdint>
#include <memory>
#include <string>

#include "zkanchor/core/types.h"
#include "zkanchor/crypto/field.h"

namespace zkanchor {

namespace util {
class ConfigManager;
class ThreadPool;
}

namespace protocol {

/// Label of the default anchor domain tag
constexpr const char* DEFAULT_DOMAIN_LABEL = "zkanchor.range.v1";

/// Config section read by ProtocolParams::FromConfig
constexpr const char* CONFIG_SECTION = "protocol";

// ============================================================================
// Parameter Stamp
// ============================================================================

/// Serialized identity of a parameter set: modulus, D, B and tag
struct ParamsStamp {
    /// 32-byte modulus + LE32 depth + LE32 range bits + 32-byte tag
    static constexpr size_t SIZE = 32 + 4 + 4 + 32;

    Uint256 modulus;
    uint32_t depth{0};
    uint32_t rangeBits{0};
    Uint256 domainTag;

    ByteVector Encode() const;

    /// Throws ProofFormatError unless exactly SIZE bytes
    static ParamsStamp Decode(const Byte* data, size_t len);

    std::string ToString() const;

    bool operator==(const ParamsStamp& other) const {
        return modulus == other.modulus && depth == other.depth &&
               rangeBits == other.rangeBits && domainTag == other.domainTag;
    }
    bool operator!=(const ParamsStamp& other) const { return !(*this == other); }
};

// ============================================================================
// Protocol Parameters
// ============================================================================

class ProtocolParams {
public:
    static constexpr size_t MIN_DEPTH = 1;
    static constexpr size_t MAX_DEPTH = 24;

    /**
     * Validate and bind a parameter set.
     *
     * Throws MerkleError::InvalidDepth if depth is outside [1, 24] and
     * ConfigError::ParameterMismatch if 2^(rangeBits+1) > p, rangeBits is
     * zero, or the tag belongs to another field.
     */
    ProtocolParams(const PrimeField& field, size_t depth, size_t rangeBits,
                   const FieldElement& domainTag);

    /// Same, with the tag built from an ASCII label
    ProtocolParams(const PrimeField& field, size_t depth, size_t rangeBits,
                   const std::string& domainLabel = DEFAULT_DOMAIN_LABEL);

    /**
     * Read the [protocol] section:
     *   curve = bn254 | bls12_381   (or modulus = 0x... hex)
     *   depth = D
     *   range_bits = B
     *   domain_tag = label          (default zkanchor.range.v1)
     *   threads = N                 (optional, 0 = hardware concurrency)
     *
     * Throws ConfigError::ParseError for missing or malformed keys.
     */
    static ProtocolParams FromConfig(const util::ConfigManager& config);

    /// Parse a config file and read it with FromConfig
    static ProtocolParams FromFile(const std::string& path);

    /// Largest admissible B for a field: bitlen(p) - 2
    static size_t MaxRangeBits(const PrimeField& field);

    const PrimeField& Field() const { return *field_; }
    size_t Depth() const { return depth_; }
    size_t RangeBits() const { return rangeBits_; }
    const FieldElement& DomainTag() const { return domainTag_; }

    /// Number of leaves a tree of this depth holds
    uint64_t Capacity() const { return uint64_t(1) << depth_; }

    /// Worker threads for tree construction (0 = hardware concurrency)
    size_t Threads() const { return threads_; }
    void SetThreads(size_t threads) { threads_ = threads; }

    /// Pool for tree construction: a dedicated pool of Threads() workers,
    /// or the shared global pool when Threads() is 0
    std::shared_ptr<util::ThreadPool> BuildPool() const;

    ParamsStamp Stamp() const;

    /// Throws ConfigError::ParameterMismatch if `stamp` names other parameters
    void RequireCompatible(const ParamsStamp& stamp) const;

    std::string ToString() const;

    bool operator==(const ProtocolParams& other) const {
        return field_ == other.field_ && depth_ == other.depth_ &&
               rangeBits_ == other.rangeBits_ && domainTag_ == other.domainTag_;
    }
    bool operator!=(const ProtocolParams& other) const { return !(*this == other); }

private:
    const PrimeField* field_;
    size_t depth_;
    size_t rangeBits_;
    FieldElement domainTag_;
    size_t threads_{0};
};

} // namespace protocol
} // namespace zkanchor

#endif // ZKANCHOR_PROTOCOL_PARAMS_H
