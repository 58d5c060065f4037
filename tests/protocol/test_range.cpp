// ZKANCHOR - Range Encoder Tests
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include <gtest/gtest.h>
#include "zkanchor/protocol/range.h"
#include "zkanchor/protocol/params.h"
#include "zkanchor/core/errors.h"

namespace zkanchor {
namespace protocol {
namespace test {

namespace {

RangeError::Kind CaptureRangeKind(const RangeEncoder& encoder, const FieldElement& value,
                                  const FieldElement& lo, const FieldElement& hi) {
    try {
        encoder.Encode(value, lo, hi);
    } catch (const RangeError& e) {
        return e.GetKind();
    }
    ADD_FAILURE() << "Encode accepted 0x" << value.ToHex();
    return RangeError::Kind::OutOfRange;
}

} // namespace

// ============================================================================
// Bit Decomposition
// ============================================================================

TEST(BitDecompositionTest, Of) {
    const PrimeField& f = PrimeField::BN254Scalar();
    BitDecomposition bits = BitDecomposition::Of(f.FromUint64(5), 4);

    ASSERT_EQ(bits.Width(), 4u);
    EXPECT_EQ(bits[0], f.One());
    EXPECT_EQ(bits[1], f.Zero());
    EXPECT_EQ(bits[2], f.One());
    EXPECT_EQ(bits[3], f.Zero());
    EXPECT_TRUE(bits.IsBoolean());
    EXPECT_EQ(bits.Reconstruct(), f.FromUint64(5));
}

TEST(BitDecompositionTest, Overflow) {
    const PrimeField& f = PrimeField::BN254Scalar();
    try {
        BitDecomposition::Of(f.FromUint64(16), 4);
        FAIL() << "expected FieldError";
    } catch (const FieldError& e) {
        EXPECT_EQ(e.GetKind(), FieldError::Kind::Overflow);
    }
}

TEST(BitDecompositionTest, NonBoolean) {
    const PrimeField& f = PrimeField::BN254Scalar();
    BitDecomposition bits(f, {f.One(), f.FromUint64(2)});
    EXPECT_FALSE(bits.IsBoolean());
    // 1 + 2 * 2
    EXPECT_EQ(bits.Reconstruct(), f.FromUint64(5));
}

TEST(BitDecompositionTest, ForeignBit) {
    const PrimeField& f = PrimeField::BN254Scalar();
    EXPECT_THROW(BitDecomposition(f, {PrimeField::BLS12_381Scalar().One()}), ConfigError);
}

// ============================================================================
// Range Encoder
// ============================================================================

class RangeEncoderTest : public ::testing::Test {
protected:
    const PrimeField& f = PrimeField::BN254Scalar();
    RangeEncoder encoder{f, 8};
};

TEST_F(RangeEncoderTest, Construction) {
    EXPECT_EQ(encoder.RangeBits(), 8u);
    EXPECT_EQ(encoder.Field(), f);

    RangeEncoder fromParams(ProtocolParams(f, 4, 16));
    EXPECT_EQ(fromParams.RangeBits(), 16u);

    EXPECT_THROW(RangeEncoder(f, 0), ConfigError);
    EXPECT_THROW(RangeEncoder(f, 253), ConfigError);
}

TEST_F(RangeEncoderTest, InclusiveBounds) {
    FieldElement lo = f.FromUint64(2);
    FieldElement hi = f.FromUint64(8);

    RangeWitness atLo = encoder.Encode(lo, lo, hi);
    EXPECT_TRUE(atLo.low.Reconstruct().IsZero());
    EXPECT_EQ(atLo.high.Reconstruct(), f.FromUint64(6));

    RangeWitness atHi = encoder.Encode(hi, lo, hi);
    EXPECT_EQ(atHi.low.Reconstruct(), f.FromUint64(6));
    EXPECT_TRUE(atHi.high.Reconstruct().IsZero());
}

TEST_F(RangeEncoderTest, GapsSumToWidth) {
    FieldElement lo = f.FromUint64(2);
    FieldElement hi = f.FromUint64(8);
    RangeWitness w = encoder.Encode(f.FromUint64(5), lo, hi);

    EXPECT_EQ(w.RangeBits(), 8u);
    EXPECT_EQ(w.value, f.FromUint64(5));
    EXPECT_EQ(w.low.Reconstruct(), f.FromUint64(3));
    EXPECT_EQ(w.high.Reconstruct(), f.FromUint64(3));
    EXPECT_EQ(w.low.Reconstruct() + w.high.Reconstruct(), hi - lo);
}

TEST_F(RangeEncoderTest, JustOutside) {
    FieldElement lo = f.FromUint64(2);
    FieldElement hi = f.FromUint64(8);
    EXPECT_EQ(CaptureRangeKind(encoder, f.FromUint64(1), lo, hi),
              RangeError::Kind::OutOfRange);
    EXPECT_EQ(CaptureRangeKind(encoder, f.FromUint64(9), lo, hi),
              RangeError::Kind::OutOfRange);
}

TEST_F(RangeEncoderTest, FarOutside) {
    FieldElement lo = f.FromUint64(0);
    FieldElement hi = f.FromUint64(255);
    // -1 in the field
    EXPECT_EQ(CaptureRangeKind(encoder, f.Zero() - f.One(), lo, hi),
              RangeError::Kind::OutOfRange);
    EXPECT_EQ(CaptureRangeKind(encoder, f.FromUint64(1000), lo, hi),
              RangeError::Kind::OutOfRange);
}

TEST_F(RangeEncoderTest, FullWidthRange) {
    FieldElement lo = f.Zero();
    FieldElement hi = f.FromUint64(255);
    EXPECT_NO_THROW(encoder.Encode(f.FromUint64(255), lo, hi));
    EXPECT_NO_THROW(encoder.Encode(f.Zero(), lo, hi));
}

TEST_F(RangeEncoderTest, InvalidQueries) {
    FieldElement v = f.FromUint64(5);
    // lo > hi
    EXPECT_EQ(CaptureRangeKind(encoder, v, f.FromUint64(8), f.FromUint64(2)),
              RangeError::Kind::InvalidQuery);
    // hi needs 9 bits
    EXPECT_EQ(CaptureRangeKind(encoder, v, f.FromUint64(2), f.FromUint64(256)),
              RangeError::Kind::InvalidQuery);

    EXPECT_TRUE(encoder.IsValidQuery(f.FromUint64(3), f.FromUint64(3)));
    EXPECT_FALSE(encoder.IsValidQuery(f.FromUint64(4), f.FromUint64(3)));
    EXPECT_FALSE(encoder.IsValidQuery(f.Zero(), f.FromUint64(256)));
}

TEST_F(RangeEncoderTest, WideUpperBoundCheckedFirst) {
    // Both lo > hi and hi too wide: the width check reports
    try {
        encoder.ValidateQuery(f.FromUint64(1000), f.FromUint64(999));
        FAIL() << "expected RangeError";
    } catch (const RangeError& e) {
        EXPECT_EQ(e.GetKind(), RangeError::Kind::InvalidQuery);
        EXPECT_NE(std::string(e.what()).find("does not fit"), std::string::npos);
    }
}

TEST_F(RangeEncoderTest, ForeignElements) {
    const PrimeField& bls = PrimeField::BLS12_381Scalar();
    EXPECT_THROW(encoder.Encode(bls.FromUint64(5), f.FromUint64(2), f.FromUint64(8)),
                 ConfigError);
    EXPECT_THROW(encoder.ValidateQuery(bls.FromUint64(2), f.FromUint64(8)), ConfigError);
    EXPECT_FALSE(encoder.IsValidQuery(bls.FromUint64(2), f.FromUint64(8)));
}

} // namespace test
} // namespace protocol
} // namespace zkanchor
