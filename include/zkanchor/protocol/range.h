// ZKANCHOR - Range Encoder
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// Arithmetization of lo <= v <= hi. The gaps d_lo = v - lo and
// d_hi = hi - v are computed in the field and each must decompose into
// B bits. With 2^(B+1) <= p a "negative" gap wraps to a value near p and
// has no B-bit decomposition, which is exactly the out-of-range case.

#ifndef ZKANCHOR_PROTOCOL_RANGE_H
#define ZKANCHOR_PROTOCOL_RANGE_H

#include <cstddef>
#include <vector>

#include "zkanchor/crypto/field.h"

namespace zkanchor {
namespace protocol {

class ProtocolParams;

// ============================================================================
// Bit Decomposition
// ============================================================================

/// Fixed-length little-endian vector of field elements meant to be 0 or 1
class BitDecomposition {
public:
    /// Throws ConfigError::ParameterMismatch for a bit from another field
    BitDecomposition(const PrimeField& field, std::vector<FieldElement> bits);

    /// Decompose `value` into exactly `width` bits.
    /// Throws FieldError::Overflow if it needs more.
    static BitDecomposition Of(const FieldElement& value, size_t width);

    const PrimeField& Field() const { return *field_; }
    size_t Width() const { return bits_.size(); }
    const std::vector<FieldElement>& Bits() const { return bits_; }
    const FieldElement& operator[](size_t i) const { return bits_[i]; }

    /// True when every entry is 0 or 1
    bool IsBoolean() const;

    /// Sum of bit_i * 2^i in the field
    FieldElement Reconstruct() const;

    bool operator==(const BitDecomposition& other) const {
        return field_ == other.field_ && bits_ == other.bits_;
    }

private:
    const PrimeField* field_;
    std::vector<FieldElement> bits_;
};

// ============================================================================
// Range Witness
// ============================================================================

struct RangeWitness {
    FieldElement value;
    FieldElement lo;
    FieldElement hi;

    /// Bits of value - lo
    BitDecomposition low;

    /// Bits of hi - value
    BitDecomposition high;

    size_t RangeBits() const { return low.Width(); }
};

// ============================================================================
// Range Encoder
// ============================================================================

class RangeEncoder {
public:
    /// Throws ConfigError::ParameterMismatch unless 1 <= B and 2^(B+1) <= p
    RangeEncoder(const PrimeField& field, size_t rangeBits);
    explicit RangeEncoder(const ProtocolParams& params);

    const PrimeField& Field() const { return *field_; }
    size_t RangeBits() const { return rangeBits_; }

    /// Throws RangeError::InvalidQuery unless lo <= hi < 2^B as integers,
    /// ConfigError::ParameterMismatch for elements of another field.
    void ValidateQuery(const FieldElement& lo, const FieldElement& hi) const;

    /// True when lo <= hi < 2^B
    bool IsValidQuery(const FieldElement& lo, const FieldElement& hi) const;

    /**
     * Produce the gap decompositions for lo <= value <= hi (inclusive).
     *
     * Throws RangeError::InvalidQuery for a malformed query and
     * RangeError::OutOfRange when value lies outside [lo, hi].
     */
    RangeWitness Encode(const FieldElement& value,
                        const FieldElement& lo,
                        const FieldElement& hi) const;

private:
    const PrimeField* field_;
    size_t rangeBits_;
};

} // namespace protocol
} // namespace zkanchor

#endif // ZKANCHOR_PROTOCOL_RANGE_H
