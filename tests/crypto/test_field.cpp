// ZKANCHOR - Finite Field Tests
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include <gtest/gtest.h>
#include "zkanchor/crypto/field.h"
#include "zkanchor/core/errors.h"

#include <set>
#include <string>

namespace zkanchor {
namespace test {

// ============================================================================
// Uint256 Tests
// ============================================================================

TEST(Uint256Test, HexRoundTrip) {
    Uint256 v = Uint256::FromHex("0x30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001");
    EXPECT_EQ(v.limbs[0], 0x43e1f593f0000001ULL);
    EXPECT_EQ(v.limbs[3], 0x30644e72e131a029ULL);
    EXPECT_EQ(v.ToHex(), "30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001");
    EXPECT_EQ(Uint256::FromHex("ff"), Uint256(255));
}

TEST(Uint256Test, FromHexRejectsMalformed) {
    EXPECT_THROW(Uint256::FromHex(""), FieldError);
    EXPECT_THROW(Uint256::FromHex("0x"), FieldError);
    EXPECT_THROW(Uint256::FromHex("12g4"), FieldError);
    EXPECT_THROW(Uint256::FromHex(std::string(65, '1')), FieldError);
}

TEST(Uint256Test, BytesAreLittleEndian) {
    Uint256 v(0x0102030405060708ULL);
    auto bytes = v.ToBytes();
    EXPECT_EQ(bytes[0], 0x08);
    EXPECT_EQ(bytes[7], 0x01);
    EXPECT_EQ(bytes[8], 0x00);
    EXPECT_EQ(Uint256(bytes.data(), bytes.size()), v);
}

TEST(Uint256Test, BitOperations) {
    Uint256 one(1);
    EXPECT_EQ((one << 200).BitLength(), 201u);
    EXPECT_TRUE((one << 200).TestBit(200));
    EXPECT_EQ(((one << 130) >> 130), one);
    EXPECT_EQ(Uint256().BitLength(), 0u);
    EXPECT_EQ(Uint256(97).ModSmall(5), 2u);
}

TEST(Uint256Test, CarryAndBorrow) {
    Uint256 max(~0ULL, ~0ULL, ~0ULL, ~0ULL);
    bool carry = false;
    Uint256 sum = Uint256::Add(max, Uint256(1), carry);
    EXPECT_TRUE(carry);
    EXPECT_TRUE(sum.IsZero());

    bool borrow = false;
    Uint256 diff = Uint256::Sub(Uint256(0), Uint256(1), borrow);
    EXPECT_TRUE(borrow);
    EXPECT_EQ(diff, max);
}

TEST(Uint256Test, WideMultiply) {
    Uint256 high;
    Uint256 low = Uint256::Mul(Uint256(1) << 255, Uint256(4), high);
    EXPECT_TRUE(low.IsZero());
    EXPECT_EQ(high, Uint256(2));
}

// ============================================================================
// Prime Field Construction
// ============================================================================

TEST(PrimeFieldTest, NamedFields) {
    const PrimeField& bn = PrimeField::BN254Scalar();
    EXPECT_EQ(bn.Name(), "bn254");
    EXPECT_EQ(bn.BitLength(), 254u);
    EXPECT_EQ(bn.ByteWidth(), 32u);

    const PrimeField& bls = PrimeField::BLS12_381Scalar();
    EXPECT_EQ(bls.Name(), "bls12_381");
    EXPECT_EQ(bls.BitLength(), 255u);

    EXPECT_EQ(PrimeField::FromName("BN254"), bn);
    EXPECT_EQ(PrimeField::FromName("bls12-381"), bls);
    EXPECT_NE(bn, bls);
}

TEST(PrimeFieldTest, FieldsAreInterned) {
    const PrimeField& a = PrimeField::Get(PrimeField::BN254Scalar().Modulus());
    EXPECT_EQ(&a, &PrimeField::BN254Scalar());

    const PrimeField& small = PrimeField::Get(Uint256(97));
    EXPECT_EQ(&small, &PrimeField::Get(Uint256(97)));
    EXPECT_EQ(small.Name(), "custom");
    EXPECT_EQ(small.ByteWidth(), 1u);

    size_t count = PrimeField::RegisteredCount();
    PrimeField::Get(Uint256(97));
    EXPECT_EQ(PrimeField::RegisteredCount(), count);
    EXPECT_THROW(PrimeField::Get(Uint256(91)), ConfigError);
    EXPECT_EQ(PrimeField::RegisteredCount(), count);
}

TEST(PrimeFieldTest, RejectsBadModuli) {
    auto expectInvalid = [](const Uint256& modulus) {
        try {
            PrimeField::Get(modulus);
            FAIL() << "accepted modulus 0x" << modulus.ToHex();
        } catch (const ConfigError& e) {
            EXPECT_EQ(e.GetKind(), ConfigError::Kind::InvalidParameter);
        }
    };
    expectInvalid(Uint256(100));                       // even
    expectInvalid(Uint256(3));                         // too small
    expectInvalid(Uint256(91));                        // 7 * 13
    expectInvalid(Uint256(561));                       // 3 * 11 * 17
    expectInvalid(Uint256(162401));                    // 17 * 41 * 233
    expectInvalid(Uint256(334153));                    // 19 * 43 * 409
    expectInvalid(Uint256(1, 0, 0, 1ULL << 63));       // 256 bits
}

TEST(PrimeFieldTest, UnknownCurveName) {
    EXPECT_THROW(PrimeField::FromName("secp256k1"), ConfigError);
}

// ============================================================================
// Montgomery Constants (BN254)
// ============================================================================

TEST(PrimeFieldTest, BN254MontgomeryConstants) {
    const PrimeField& f = PrimeField::BN254Scalar();
    FieldElement twoTo128 = f.Reduce(Uint256(1) << 128);

    // R = 2^256 mod p
    EXPECT_EQ(twoTo128.Square().ToUint256(),
              Uint256::FromHex("0e0a77c19a07df2f666ea36f7879462e36fc76959f60cd29ac96341c4ffffffb"));

    // R^2 = 2^512 mod p
    EXPECT_EQ(twoTo128.Pow(4).ToUint256(),
              Uint256::FromHex("0216d0b17f4e44a58c49833d53bb808553fe3ab1e35c59e31bb8e645ae216da7"));
}

// ============================================================================
// Field Element Arithmetic
// ============================================================================

class FieldElementTest : public ::testing::Test {
protected:
    const PrimeField& f = PrimeField::BN254Scalar();
};

TEST_F(FieldElementTest, Identities) {
    FieldElement a = f.FromUint64(123456789);
    EXPECT_EQ(a + f.Zero(), a);
    EXPECT_EQ(a * f.One(), a);
    EXPECT_TRUE((a - a).IsZero());
    EXPECT_TRUE(f.One().IsOne());
    EXPECT_EQ(a + (-a), f.Zero());
    EXPECT_EQ(-f.Zero(), f.Zero());
}

TEST_F(FieldElementTest, WrapAround) {
    FieldElement minusOne = f.Zero() - f.One();
    EXPECT_EQ(minusOne.ToHex(),
              "30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000000");
    EXPECT_TRUE((minusOne + f.One()).IsZero());
}

TEST_F(FieldElementTest, KnownInverses) {
    EXPECT_EQ(f.FromUint64(2).Inverse().ToHex(),
              "183227397098d014dc2822db40c0ac2e9419f4243cdcb848a1f0fac9f8000001");
    EXPECT_EQ(f.FromUint64(3).Inverse().ToHex(),
              "2042def740cbc01bd03583cf0100e59370229adafbd0f5b62d414e62a0000001");

    FieldElement x = f.FromHex("0x1234567890abcdef1234567890abcdef");
    EXPECT_TRUE((x * x.Inverse()).IsOne());
}

TEST_F(FieldElementTest, InverseOfZero) {
    try {
        f.Zero().Inverse();
        FAIL() << "expected FieldError";
    } catch (const FieldError& e) {
        EXPECT_EQ(e.GetKind(), FieldError::Kind::NotInvertible);
    }
}

TEST_F(FieldElementTest, Reduce) {
    Uint256 big = (Uint256(1) << 200);
    big.limbs[0] = 12345;
    EXPECT_EQ(f.Reduce(big).ToUint256(), big);
    EXPECT_TRUE(f.Reduce(f.Modulus()).IsZero());
}

TEST_F(FieldElementTest, PowerAndSbox) {
    FieldElement x = f.FromUint64(7);
    EXPECT_EQ(x.PoseidonSbox(), f.FromUint64(16807));
    EXPECT_EQ(x.Pow(uint64_t(3)), f.FromUint64(343));
    EXPECT_EQ(x.Pow(uint64_t(0)), f.One());
    EXPECT_EQ(x.Square(), x * x);
}

TEST_F(FieldElementTest, CanonicalEncoding) {
    FieldElement x = f.FromUint64(0x0102);
    ByteVector bytes = x.ToBytes();
    ASSERT_EQ(bytes.size(), 32u);
    EXPECT_EQ(bytes[0], 0x02);
    EXPECT_EQ(bytes[1], 0x01);
    EXPECT_EQ(f.FromBytes(bytes), x);
}

TEST_F(FieldElementTest, FromBytesRejectsWrongLength) {
    ByteVector shortBytes(31, 0);
    try {
        f.FromBytes(shortBytes);
        FAIL() << "expected FieldError";
    } catch (const FieldError& e) {
        EXPECT_EQ(e.GetKind(), FieldError::Kind::BadEncoding);
    }
}

TEST_F(FieldElementTest, FromBytesRejectsNonCanonical) {
    auto modulusBytes = f.Modulus().ToBytes();
    ByteVector bytes(modulusBytes.begin(), modulusBytes.end());
    try {
        f.FromBytes(bytes);
        FAIL() << "expected FieldError";
    } catch (const FieldError& e) {
        EXPECT_EQ(e.GetKind(), FieldError::Kind::NonCanonical);
    }
    EXPECT_THROW(f.FromUint256(f.Modulus()), FieldError);
}

TEST_F(FieldElementTest, ToBitsAndOverflow) {
    FieldElement x = f.FromUint64(0b1011);
    std::vector<Byte> bits = x.ToBits(6);
    EXPECT_EQ(bits, (std::vector<Byte>{1, 1, 0, 1, 0, 0}));
    EXPECT_EQ(x.BitLength(), 4u);

    try {
        x.ToBits(3);
        FAIL() << "expected FieldError";
    } catch (const FieldError& e) {
        EXPECT_EQ(e.GetKind(), FieldError::Kind::Overflow);
    }
}

TEST_F(FieldElementTest, ToUint64) {
    EXPECT_EQ(f.FromUint64(~0ULL).ToUint64(), ~0ULL);
    EXPECT_THROW(f.Reduce(Uint256(1) << 64).ToUint64(), FieldError);
}

TEST_F(FieldElementTest, CrossFieldArithmeticThrows) {
    FieldElement a = f.FromUint64(5);
    FieldElement b = PrimeField::BLS12_381Scalar().FromUint64(5);

    EXPECT_FALSE(a == b);
    try {
        (void)(a + b);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.GetKind(), ConfigError::Kind::ParameterMismatch);
    }
    EXPECT_THROW((void)(a * b), ConfigError);
    EXPECT_THROW((void)(a - b), ConfigError);
}

TEST_F(FieldElementTest, RandomIsCanonicalAndVaries) {
    std::set<std::string> seen;
    for (int i = 0; i < 8; ++i) {
        FieldElement r = f.Random();
        EXPECT_LT(r.ToUint256(), f.Modulus());
        seen.insert(r.ToHex());
    }
    EXPECT_GT(seen.size(), 1u);
}

TEST(SmallFieldTest, ArithmeticModulo97) {
    const PrimeField& f = PrimeField::Get(Uint256(97));
    EXPECT_EQ(f.FromUint64(50) + f.FromUint64(60), f.FromUint64(13));
    EXPECT_EQ(f.FromUint64(10) * f.FromUint64(10), f.FromUint64(3));
    EXPECT_EQ(f.FromUint64(2).Inverse(), f.FromUint64(49));
    EXPECT_EQ(f.FromUint64(96).ToBytes(), ByteVector{96});
    EXPECT_THROW(f.FromUint64(97), FieldError);
}

// ============================================================================
// Limb Helpers
// ============================================================================

TEST(LimbTest, SplitAndJoin) {
    const PrimeField& f = PrimeField::BN254Scalar();
    Uint256 value(0x1111, 0x2222, 0x3333, 0x4444);

    auto limbs = SplitToLimbs(f, value);
    EXPECT_EQ(limbs.first.ToUint256(), Uint256(0x1111, 0x2222, 0, 0));
    EXPECT_EQ(limbs.second.ToUint256(), Uint256(0x3333, 0x4444, 0, 0));
    EXPECT_EQ(JoinLimbs(limbs.first, limbs.second), value);
}

TEST(LimbTest, JoinRejectsWideLimb) {
    const PrimeField& f = PrimeField::BN254Scalar();
    FieldElement wide = f.Reduce(Uint256(1) << 130);
    EXPECT_THROW(JoinLimbs(wide, f.Zero()), FieldError);
}

TEST(LimbTest, SplitNeedsWideField) {
    EXPECT_THROW(SplitToLimbs(PrimeField::Get(Uint256(97)), Uint256(1)), ConfigError);
}

} // namespace test
} // namespace zkanchor
