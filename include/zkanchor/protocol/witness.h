// ZKANCHOR - Witness Assembly
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// The private input vector of the anchored range circuit, laid out as
//   [leaf, siblings (D), directions (D), low bits (B), high bits (B)]
// together with the public tuple (anchor, lo, hi).

#ifndef ZKANCHOR_PROTOCOL_WITNESS_H
#define ZKANCHOR_PROTOCOL_WITNESS_H

#include <cstddef>
#include <string>
#include <vector>

#include "zkanchor/core/types.h"
#include "zkanchor/crypto/field.h"
#include "zkanchor/merkle/merkle_tree.h"
#include "zkanchor/protocol/range.h"

namespace zkanchor {
namespace protocol {

class ProtocolParams;

// ============================================================================
// Public Inputs
// ============================================================================

/// Public tuple checked by every verifier, in this order
struct PublicInputs {
    static constexpr size_t COUNT = 3;

    FieldElement anchor;
    FieldElement lo;
    FieldElement hi;

    const PrimeField& Field() const { return anchor.Field(); }

    /// [anchor, lo, hi]
    std::vector<FieldElement> ToVector() const { return {anchor, lo, hi}; }

    /// COUNT canonical field encodings
    ByteVector ToBytes() const;

    /// Throws FieldError on a wrong length or non-canonical element
    static PublicInputs FromBytes(const PrimeField& field,
                                  const Byte* data, size_t len);

    bool operator==(const PublicInputs& other) const {
        return anchor == other.anchor && lo == other.lo && hi == other.hi;
    }
    bool operator!=(const PublicInputs& other) const { return !(*this == other); }
};

// ============================================================================
// Witness
// ============================================================================

class Witness {
public:
    /// Number of entries for depth D and width B: 1 + 2D + 2B
    static size_t SizeFor(size_t depth, size_t rangeBits) {
        return 1 + 2 * depth + 2 * rangeBits;
    }

    /// Wrap a raw vector; throws WitnessError::ShapeMismatch on a wrong size
    static Witness FromValues(size_t depth, size_t rangeBits,
                              std::vector<FieldElement> values);

    /// Throws WitnessError::ShapeMismatch on a wrong length and
    /// FieldError::NonCanonical on an element >= p
    static Witness FromBytes(const PrimeField& field, size_t depth, size_t rangeBits,
                             const Byte* data, size_t len);

    const PrimeField& Field() const { return values_.front().Field(); }
    size_t Depth() const { return depth_; }
    size_t RangeBits() const { return rangeBits_; }
    size_t Size() const { return values_.size(); }
    const std::vector<FieldElement>& Values() const { return values_; }

    const FieldElement& Leaf() const { return values_[0]; }
    const FieldElement& Sibling(size_t level) const { return values_[1 + level]; }
    const FieldElement& Direction(size_t level) const { return values_[1 + depth_ + level]; }
    const FieldElement& LowBit(size_t i) const { return values_[1 + 2 * depth_ + i]; }
    const FieldElement& HighBit(size_t i) const {
        return values_[1 + 2 * depth_ + rangeBits_ + i];
    }

    std::vector<FieldElement> Siblings() const;
    std::vector<FieldElement> Directions() const;
    BitDecomposition LowBits() const;
    BitDecomposition HighBits() const;

    /// Concatenated canonical encodings, in layout order
    ByteVector ToBytes() const;

    bool operator==(const Witness& other) const {
        return depth_ == other.depth_ && rangeBits_ == other.rangeBits_ &&
               values_ == other.values_;
    }

private:
    friend class WitnessAssembler;

    Witness(size_t depth, size_t rangeBits, std::vector<FieldElement> values)
        : depth_(depth), rangeBits_(rangeBits), values_(std::move(values)) {}

    size_t depth_;
    size_t rangeBits_;
    std::vector<FieldElement> values_;
};

// ============================================================================
// Witness Assembler
// ============================================================================

class WitnessAssembler {
public:
    explicit WitnessAssembler(const ProtocolParams& params);

    /**
     * Lay out the private inputs without transforming any value.
     *
     * Throws WitnessError::ShapeMismatch if the path does not have D levels
     * or a decomposition does not have B bits, and
     * ConfigError::ParameterMismatch for elements of another field.
     */
    Witness Assemble(const FieldElement& leafValue,
                     const MerklePath& path,
                     const RangeWitness& range) const;

private:
    const PrimeField* field_;
    size_t depth_;
    size_t rangeBits_;
};

} // namespace protocol
} // namespace zkanchor

#endif // ZKANCHOR_PROTOCOL_WITNESS_H
