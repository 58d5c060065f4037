// ZKANCHOR - Protocol Parameters Implementation
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include "zkanchor/protocol/params.h"

#include "zkanchor/core/errors.h"
#include "zkanchor/crypto/poseidon.h"
#include "zkanchor/util/config.h"
#include "zkanchor/util/logging.h"
#include "zkanchor/util/threadpool.h"

#include <sstream>

namespace zkanchor {
namespace protocol {

// ============================================================================
// ParamsStamp
// ============================================================================

ByteVector ParamsStamp::Encode() const {
    ByteVector result;
    result.reserve(SIZE);

    auto modulusBytes = modulus.ToBytes();
    result.insert(result.end(), modulusBytes.begin(), modulusBytes.end());
    WriteLE32(result, depth);
    WriteLE32(result, rangeBits);
    auto tagBytes = domainTag.ToBytes();
    result.insert(result.end(), tagBytes.begin(), tagBytes.end());

    return result;
}

ParamsStamp ParamsStamp::Decode(const Byte* data, size_t len) {
    if (len != SIZE) {
        throw ProofFormatError("parameter stamp is " + std::to_string(len) +
                               " bytes, expected " + std::to_string(SIZE));
    }

    ParamsStamp stamp;
    stamp.modulus = Uint256(data, 32);
    stamp.depth = ReadLE32(data + 32);
    stamp.rangeBits = ReadLE32(data + 36);
    stamp.domainTag = Uint256(data + 40, 32);
    return stamp;
}

std::string ParamsStamp::ToString() const {
    std::ostringstream oss;
    oss << "ParamsStamp(modulus=0x" << modulus.ToHex()
        << ", depth=" << depth
        << ", rangeBits=" << rangeBits
        << ", tag=0x" << domainTag.ToHex() << ")";
    return oss.str();
}

// ============================================================================
// ProtocolParams
// ============================================================================

ProtocolParams::ProtocolParams(const PrimeField& field, size_t depth,
                               size_t rangeBits, const FieldElement& domainTag)
    : field_(&field)
    , depth_(depth)
    , rangeBits_(rangeBits)
    , domainTag_(domainTag) {
    if (depth < MIN_DEPTH || depth > MAX_DEPTH) {
        throw MerkleError(MerkleError::Kind::InvalidDepth,
                          "depth " + std::to_string(depth) + " outside [" +
                          std::to_string(MIN_DEPTH) + ", " +
                          std::to_string(MAX_DEPTH) + "]");
    }
    // 2^(B+1) <= p keeps d_lo + d_hi below p, so no wraparound can pass
    if (rangeBits == 0 || rangeBits > MaxRangeBits(field)) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "range width " + std::to_string(rangeBits) +
                          " bits is not admissible for the " +
                          std::to_string(field.BitLength()) + "-bit " +
                          field.Name() + " field (max " +
                          std::to_string(MaxRangeBits(field)) + ")");
    }
    if (domainTag.Field() != field) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "domain tag belongs to the " + domainTag.Field().Name() +
                          " field, parameters use " + field.Name());
    }
}

ProtocolParams::ProtocolParams(const PrimeField& field, size_t depth,
                               size_t rangeBits, const std::string& domainLabel)
    : ProtocolParams(field, depth, rangeBits, PoseidonDomain(field, domainLabel)) {}

size_t ProtocolParams::MaxRangeBits(const PrimeField& field) {
    return field.BitLength() >= 2 ? field.BitLength() - 2 : 0;
}

ProtocolParams ProtocolParams::FromConfig(const util::ConfigManager& config) {
    auto requireUInt = [&config](const char* key) -> uint64_t {
        if (!config.HasKey(key, CONFIG_SECTION)) {
            throw ConfigError(ConfigError::Kind::ParseError,
                              std::string("missing [") + CONFIG_SECTION + "] " + key);
        }
        auto value = config.TryGetUInt(key, CONFIG_SECTION);
        if (!value) {
            throw ConfigError(ConfigError::Kind::ParseError,
                              std::string("[") + CONFIG_SECTION + "] " + key +
                              " is not an unsigned integer");
        }
        return *value;
    };

    auto curve = config.TryGetString("curve", CONFIG_SECTION);
    auto modulusHex = config.TryGetString("modulus", CONFIG_SECTION);
    if (curve && modulusHex) {
        throw ConfigError(ConfigError::Kind::ParseError,
                          "set either curve or modulus, not both");
    }

    const PrimeField* field = nullptr;
    if (curve) {
        field = &PrimeField::FromName(*curve);
    } else if (modulusHex) {
        Uint256 modulus;
        try {
            modulus = Uint256::FromHex(*modulusHex);
        } catch (const FieldError& e) {
            throw ConfigError(ConfigError::Kind::ParseError,
                              "modulus: " + std::string(e.what()));
        }
        field = &PrimeField::Get(modulus);
    } else {
        field = &PrimeField::BN254Scalar();
    }

    uint64_t depth = requireUInt("depth");
    uint64_t rangeBits = requireUInt("range_bits");
    std::string label = config.GetString("domain_tag", DEFAULT_DOMAIN_LABEL,
                                         CONFIG_SECTION);

    ProtocolParams params(*field, static_cast<size_t>(depth),
                          static_cast<size_t>(rangeBits), label);

    if (config.HasKey("threads", CONFIG_SECTION)) {
        params.SetThreads(static_cast<size_t>(requireUInt("threads")));
    }

    LOG_INFO(util::LogCategory::CONFIG) << "Protocol parameters: " << params.ToString();
    return params;
}

ProtocolParams ProtocolParams::FromFile(const std::string& path) {
    util::ConfigManager config;
    util::ConfigParseResult result = config.ParseFile(path);
    if (!result.success) {
        throw ConfigError(ConfigError::Kind::ParseError, result.Describe());
    }
    return FromConfig(config);
}

std::shared_ptr<util::ThreadPool> ProtocolParams::BuildPool() const {
    if (threads_ == 0) {
        return util::GetGlobalThreadPool();
    }
    util::ThreadPool::Config config;
    config.numThreads = threads_;
    config.name = "tree-build";
    return std::make_shared<util::ThreadPool>(config);
}

ParamsStamp ProtocolParams::Stamp() const {
    ParamsStamp stamp;
    stamp.modulus = field_->Modulus();
    stamp.depth = static_cast<uint32_t>(depth_);
    stamp.rangeBits = static_cast<uint32_t>(rangeBits_);
    stamp.domainTag = domainTag_.ToUint256();
    return stamp;
}

void ProtocolParams::RequireCompatible(const ParamsStamp& stamp) const {
    ParamsStamp ours = Stamp();
    if (stamp != ours) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "proof was produced under " + stamp.ToString() +
                          ", verifier expects " + ours.ToString());
    }
}

std::string ProtocolParams::ToString() const {
    std::ostringstream oss;
    oss << "ProtocolParams(field=" << field_->Name()
        << ", depth=" << depth_
        << ", rangeBits=" << rangeBits_
        << ", tag=0x" << domainTag_.ToHex() << ")";
    return oss.str();
}

} // namespace protocol
} // namespace zkanchor
