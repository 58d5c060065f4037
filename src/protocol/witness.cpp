// ZKANCHOR - Witness Assembly Implementation
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include "zkanchor/protocol/witness.h"

#include "zkanchor/core/errors.h"
#include "zkanchor/protocol/params.h"
#include "zkanchor/util/logging.h"

namespace zkanchor {
namespace protocol {

namespace {

void AppendElement(ByteVector& out, const FieldElement& fe) {
    ByteVector bytes = fe.ToBytes();
    out.insert(out.end(), bytes.begin(), bytes.end());
}

} // namespace

// ============================================================================
// PublicInputs
// ============================================================================

ByteVector PublicInputs::ToBytes() const {
    ByteVector result;
    result.reserve(COUNT * Field().ByteWidth());
    AppendElement(result, anchor);
    AppendElement(result, lo);
    AppendElement(result, hi);
    return result;
}

PublicInputs PublicInputs::FromBytes(const PrimeField& field,
                                     const Byte* data, size_t len) {
    const size_t width = field.ByteWidth();
    if (len != COUNT * width) {
        throw FieldError(FieldError::Kind::BadEncoding,
                         "public inputs are " + std::to_string(len) +
                         " bytes, expected " + std::to_string(COUNT * width));
    }
    return PublicInputs{field.FromBytes(data, width),
                        field.FromBytes(data + width, width),
                        field.FromBytes(data + 2 * width, width)};
}

// ============================================================================
// Witness
// ============================================================================

Witness Witness::FromValues(size_t depth, size_t rangeBits,
                            std::vector<FieldElement> values) {
    const size_t expected = SizeFor(depth, rangeBits);
    if (values.size() != expected) {
        throw WitnessError(WitnessError::Kind::ShapeMismatch,
                           "witness has " + std::to_string(values.size()) +
                           " entries, expected " + std::to_string(expected));
    }
    const PrimeField& field = values.front().Field();
    for (const auto& value : values) {
        if (value.Field() != field) {
            throw ConfigError(ConfigError::Kind::ParameterMismatch,
                              "witness mixes elements of different fields");
        }
    }
    return Witness(depth, rangeBits, std::move(values));
}

Witness Witness::FromBytes(const PrimeField& field, size_t depth, size_t rangeBits,
                           const Byte* data, size_t len) {
    const size_t count = SizeFor(depth, rangeBits);
    const size_t width = field.ByteWidth();
    if (len != count * width) {
        throw WitnessError(WitnessError::Kind::ShapeMismatch,
                           "witness encoding is " + std::to_string(len) +
                           " bytes, expected " + std::to_string(count * width));
    }

    std::vector<FieldElement> values;
    values.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        values.push_back(field.FromBytes(data + i * width, width));
    }
    return Witness(depth, rangeBits, std::move(values));
}

std::vector<FieldElement> Witness::Siblings() const {
    return std::vector<FieldElement>(values_.begin() + 1,
                                     values_.begin() + 1 + depth_);
}

std::vector<FieldElement> Witness::Directions() const {
    return std::vector<FieldElement>(values_.begin() + 1 + depth_,
                                     values_.begin() + 1 + 2 * depth_);
}

BitDecomposition Witness::LowBits() const {
    auto begin = values_.begin() + 1 + 2 * depth_;
    return BitDecomposition(Field(),
                            std::vector<FieldElement>(begin, begin + rangeBits_));
}

BitDecomposition Witness::HighBits() const {
    auto begin = values_.begin() + 1 + 2 * depth_ + rangeBits_;
    return BitDecomposition(Field(),
                            std::vector<FieldElement>(begin, begin + rangeBits_));
}

ByteVector Witness::ToBytes() const {
    ByteVector result;
    result.reserve(values_.size() * Field().ByteWidth());
    for (const auto& value : values_) {
        AppendElement(result, value);
    }
    return result;
}

// ============================================================================
// WitnessAssembler
// ============================================================================

WitnessAssembler::WitnessAssembler(const ProtocolParams& params)
    : field_(&params.Field())
    , depth_(params.Depth())
    , rangeBits_(params.RangeBits()) {}

Witness WitnessAssembler::Assemble(const FieldElement& leafValue,
                                   const MerklePath& path,
                                   const RangeWitness& range) const {
    if (path.siblings.size() != depth_ || path.directions.size() != depth_) {
        throw WitnessError(WitnessError::Kind::ShapeMismatch,
                           "path has " + std::to_string(path.siblings.size()) +
                           " levels, expected " + std::to_string(depth_));
    }
    if (range.low.Width() != rangeBits_ || range.high.Width() != rangeBits_) {
        throw WitnessError(WitnessError::Kind::ShapeMismatch,
                           "range decompositions have " +
                           std::to_string(range.low.Width()) + " and " +
                           std::to_string(range.high.Width()) + " bits, expected " +
                           std::to_string(rangeBits_));
    }
    if (leafValue.Field() != *field_ || range.low.Field() != *field_ ||
        range.high.Field() != *field_) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "witness inputs belong to a different field");
    }

    std::vector<FieldElement> values;
    values.reserve(Witness::SizeFor(depth_, rangeBits_));

    values.push_back(leafValue);
    for (const auto& sibling : path.siblings) {
        if (sibling.Field() != *field_) {
            throw ConfigError(ConfigError::Kind::ParameterMismatch,
                              "path sibling belongs to a different field");
        }
        values.push_back(sibling);
    }
    for (bool direction : path.directions) {
        values.push_back(direction ? field_->One() : field_->Zero());
    }
    values.insert(values.end(), range.low.Bits().begin(), range.low.Bits().end());
    values.insert(values.end(), range.high.Bits().begin(), range.high.Bits().end());

    LOG_TRACE(util::LogCategory::WITNESS) << "Assembled witness of "
        << values.size() << " elements";

    return Witness(depth_, rangeBits_, std::move(values));
}

} // namespace protocol
} // namespace zkanchor
