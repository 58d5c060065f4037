// ZKANCHOR - Protocol Parameter Tests
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include <gtest/gtest.h>
#include "zkanchor/protocol/params.h"
#include "zkanchor/core/errors.h"
#include "zkanchor/crypto/poseidon.h"
#include "zkanchor/util/threadpool.h"

namespace zkanchor {
namespace protocol {
namespace test {

// ============================================================================
// Construction
// ============================================================================

TEST(ProtocolParamsTest, DefaultLabel) {
    const PrimeField& f = PrimeField::BN254Scalar();
    ProtocolParams params(f, 4, 8);

    EXPECT_EQ(params.Field(), f);
    EXPECT_EQ(params.Depth(), 4u);
    EXPECT_EQ(params.RangeBits(), 8u);
    EXPECT_EQ(params.Capacity(), 16u);
    EXPECT_EQ(params.DomainTag(), PoseidonDomain(f, DEFAULT_DOMAIN_LABEL));
    EXPECT_EQ(params.Threads(), 0u);
}

TEST(ProtocolParamsTest, ExplicitTag) {
    const PrimeField& f = PrimeField::BN254Scalar();
    ProtocolParams params(f, 4, 8, f.FromUint64(77));
    EXPECT_EQ(params.DomainTag(), f.FromUint64(77));
}

TEST(ProtocolParamsTest, MaxRangeBits) {
    EXPECT_EQ(ProtocolParams::MaxRangeBits(PrimeField::BN254Scalar()), 252u);
    EXPECT_EQ(ProtocolParams::MaxRangeBits(PrimeField::BLS12_381Scalar()), 253u);

    EXPECT_NO_THROW(ProtocolParams(PrimeField::BN254Scalar(), 4, 252));
}

TEST(ProtocolParamsTest, RejectsBadDepth) {
    const PrimeField& f = PrimeField::BN254Scalar();
    try {
        ProtocolParams params(f, 0, 8);
        FAIL() << "expected MerkleError";
    } catch (const MerkleError& e) {
        EXPECT_EQ(e.GetKind(), MerkleError::Kind::InvalidDepth);
    }
    EXPECT_THROW(ProtocolParams(f, ProtocolParams::MAX_DEPTH + 1, 8), MerkleError);
}

TEST(ProtocolParamsTest, RejectsBadRangeWidth) {
    const PrimeField& f = PrimeField::BN254Scalar();
    for (size_t bits : {size_t(0), size_t(253), size_t(300)}) {
        try {
            ProtocolParams params(f, 4, bits);
            FAIL() << "accepted " << bits << " bits";
        } catch (const ConfigError& e) {
            EXPECT_EQ(e.GetKind(), ConfigError::Kind::ParameterMismatch);
        }
    }
}

TEST(ProtocolParamsTest, RejectsForeignTag) {
    const PrimeField& f = PrimeField::BN254Scalar();
    FieldElement tag = PrimeField::BLS12_381Scalar().One();
    EXPECT_THROW(ProtocolParams(f, 4, 8, tag), ConfigError);
}

TEST(ProtocolParamsTest, EqualityIgnoresThreads) {
    const PrimeField& f = PrimeField::BN254Scalar();
    ProtocolParams a(f, 4, 8);
    ProtocolParams b(f, 4, 8);
    b.SetThreads(3);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, ProtocolParams(f, 5, 8));
    EXPECT_NE(a, ProtocolParams(f, 4, 9));
    EXPECT_NE(a, ProtocolParams(f, 4, 8, "other.label"));
    EXPECT_NE(a, ProtocolParams(PrimeField::BLS12_381Scalar(), 4, 8));
}

TEST(ProtocolParamsTest, BuildPoolHonoursThreads) {
    ProtocolParams params(PrimeField::BN254Scalar(), 4, 8);
    EXPECT_EQ(params.BuildPool(), util::GetGlobalThreadPool());

    params.SetThreads(3);
    std::shared_ptr<util::ThreadPool> pool = params.BuildPool();
    EXPECT_EQ(pool->ThreadCount(), 3u);
    EXPECT_NE(pool, util::GetGlobalThreadPool());

    params.SetThreads(1);
    EXPECT_EQ(params.BuildPool()->ThreadCount(), 1u);
}

TEST(ProtocolParamsTest, ToString) {
    ProtocolParams params(PrimeField::BN254Scalar(), 4, 8);
    std::string text = params.ToString();
    EXPECT_NE(text.find("bn254"), std::string::npos);
    EXPECT_NE(text.find("depth=4"), std::string::npos);
    EXPECT_NE(text.find("rangeBits=8"), std::string::npos);
}

// ============================================================================
// Parameter Stamp
// ============================================================================

TEST(ParamsStampTest, EncodeDecode) {
    ProtocolParams params(PrimeField::BN254Scalar(), 6, 40);
    ParamsStamp stamp = params.Stamp();

    EXPECT_EQ(stamp.modulus, params.Field().Modulus());
    EXPECT_EQ(stamp.depth, 6u);
    EXPECT_EQ(stamp.rangeBits, 40u);
    EXPECT_EQ(stamp.domainTag, params.DomainTag().ToUint256());

    ByteVector bytes = stamp.Encode();
    ASSERT_EQ(bytes.size(), ParamsStamp::SIZE);
    EXPECT_EQ(bytes[32], 6);
    EXPECT_EQ(bytes[36], 40);
    EXPECT_EQ(ParamsStamp::Decode(bytes.data(), bytes.size()), stamp);
}

TEST(ParamsStampTest, DecodeRejectsWrongLength) {
    ByteVector bytes(ParamsStamp::SIZE - 1, 0);
    EXPECT_THROW(ParamsStamp::Decode(bytes.data(), bytes.size()), ProofFormatError);
}

TEST(ParamsStampTest, RequireCompatible) {
    const PrimeField& f = PrimeField::BN254Scalar();
    ProtocolParams params(f, 4, 8);

    EXPECT_NO_THROW(params.RequireCompatible(params.Stamp()));

    auto expectMismatch = [&params](const ParamsStamp& stamp) {
        try {
            params.RequireCompatible(stamp);
            FAIL() << "accepted " << stamp.ToString();
        } catch (const ConfigError& e) {
            EXPECT_EQ(e.GetKind(), ConfigError::Kind::ParameterMismatch);
        }
    };
    expectMismatch(ProtocolParams(f, 5, 8).Stamp());
    expectMismatch(ProtocolParams(f, 4, 16).Stamp());
    expectMismatch(ProtocolParams(f, 4, 8, "another.tag").Stamp());
    expectMismatch(ProtocolParams(PrimeField::BLS12_381Scalar(), 4, 8).Stamp());
}

} // namespace test
} // namespace protocol
} // namespace zkanchor
