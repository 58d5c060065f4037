// ZKANCHOR - Range Encoder Implementation
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include "zkanchor/protocol/range.h"

#include "zkanchor/core/errors.h"
#include "zkanchor/protocol/params.h"
#include "zkanchor/util/logging.h"

namespace zkanchor {
namespace protocol {

// ============================================================================
// BitDecomposition
// ============================================================================

BitDecomposition::BitDecomposition(const PrimeField& field,
                                   std::vector<FieldElement> bits)
    : field_(&field), bits_(std::move(bits)) {
    for (const auto& bit : bits_) {
        if (bit.Field() != field) {
            throw ConfigError(ConfigError::Kind::ParameterMismatch,
                              "bit belongs to the " + bit.Field().Name() +
                              " field, expected " + field.Name());
        }
    }
}

BitDecomposition BitDecomposition::Of(const FieldElement& value, size_t width) {
    const PrimeField& field = value.Field();
    std::vector<Byte> raw = value.ToBits(width);

    std::vector<FieldElement> bits;
    bits.reserve(width);
    for (Byte b : raw) {
        bits.push_back(b ? field.One() : field.Zero());
    }
    return BitDecomposition(field, std::move(bits));
}

bool BitDecomposition::IsBoolean() const {
    for (const auto& bit : bits_) {
        if (!bit.IsZero() && !bit.IsOne()) {
            return false;
        }
    }
    return true;
}

FieldElement BitDecomposition::Reconstruct() const {
    FieldElement acc = field_->Zero();
    FieldElement power = field_->One();
    for (const auto& bit : bits_) {
        acc = acc + bit * power;
        power = power + power;
    }
    return acc;
}

// ============================================================================
// RangeEncoder
// ============================================================================

RangeEncoder::RangeEncoder(const PrimeField& field, size_t rangeBits)
    : field_(&field), rangeBits_(rangeBits) {
    if (rangeBits == 0 || rangeBits > ProtocolParams::MaxRangeBits(field)) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "range width " + std::to_string(rangeBits) +
                          " bits is not admissible for the " + field.Name() +
                          " field");
    }
}

RangeEncoder::RangeEncoder(const ProtocolParams& params)
    : RangeEncoder(params.Field(), params.RangeBits()) {}

void RangeEncoder::ValidateQuery(const FieldElement& lo,
                                 const FieldElement& hi) const {
    if (lo.Field() != *field_ || hi.Field() != *field_) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "range bounds belong to a different field");
    }
    if (hi.BitLength() > rangeBits_) {
        throw RangeError(RangeError::Kind::InvalidQuery,
                         "upper bound 0x" + hi.ToHex() + " does not fit in " +
                         std::to_string(rangeBits_) + " bits");
    }
    if (lo.ToUint256() > hi.ToUint256()) {
        throw RangeError(RangeError::Kind::InvalidQuery,
                         "lower bound 0x" + lo.ToHex() +
                         " exceeds upper bound 0x" + hi.ToHex());
    }
}

bool RangeEncoder::IsValidQuery(const FieldElement& lo,
                                const FieldElement& hi) const {
    return lo.Field() == *field_ && hi.Field() == *field_ &&
           hi.BitLength() <= rangeBits_ &&
           lo.ToUint256() <= hi.ToUint256();
}

RangeWitness RangeEncoder::Encode(const FieldElement& value,
                                  const FieldElement& lo,
                                  const FieldElement& hi) const {
    ValidateQuery(lo, hi);
    if (value.Field() != *field_) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "value belongs to a different field");
    }

    // With lo <= hi < 2^B both gaps fit in B bits exactly when lo <= value <= hi
    const Uint256 v = value.ToUint256();
    if (v < lo.ToUint256()) {
        throw RangeError(RangeError::Kind::OutOfRange,
                         "value 0x" + value.ToHex() + " is below the lower bound");
    }
    if (v > hi.ToUint256()) {
        throw RangeError(RangeError::Kind::OutOfRange,
                         "value 0x" + value.ToHex() + " is above the upper bound");
    }

    LOG_TRACE(util::LogCategory::RANGE) << "Encoded range witness with "
        << rangeBits_ << "-bit gaps";

    return RangeWitness{value, lo, hi,
                        BitDecomposition::Of(value - lo, rangeBits_),
                        BitDecomposition::Of(hi - value, rangeBits_)};
}

} // namespace protocol
} // namespace zkanchor
